#pragma once

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "junction/vector.hpp"

namespace junction::http {

struct Header {
  std::string name;
  std::string value;
};

// Tells whether given name is a valid HTTP header field name (non-empty token).
[[nodiscard]] bool IsValidHeaderName(std::string_view name) noexcept;

// Tells whether given value can be emitted as-is (no CR / LF, visible ASCII or tab).
[[nodiscard]] bool IsValidHeaderValue(std::string_view value) noexcept;

// Ordered collection of header fields.
// Names are compared case-insensitively, insertion order is preserved for emission.
// Duplicated names are allowed through add(), set() collapses them into a single field.
class HeaderMap {
 public:
  using const_iterator = vector<Header>::const_iterator;

  HeaderMap() noexcept = default;

  // Builds a map by adding each pair in order. Throws std::invalid_argument on invalid names or values.
  HeaderMap(std::initializer_list<std::pair<std::string_view, std::string_view>> headers);

  // Appends a field, keeping existing fields of the same name.
  // Throws std::invalid_argument on invalid names or values.
  void add(std::string_view name, std::string_view value);

  // Replaces all fields named 'name' by a single one, appended at the position of the first one if any.
  // Throws std::invalid_argument on invalid names or values.
  void set(std::string_view name, std::string_view value);

  // Removes all fields named 'name' and returns how many were removed.
  std::size_t erase(std::string_view name);

  // Value of the first field named 'name', if any.
  [[nodiscard]] std::optional<std::string_view> get(std::string_view name) const noexcept;

  [[nodiscard]] bool contains(std::string_view name) const noexcept { return get(name).has_value(); }

  [[nodiscard]] std::size_t size() const noexcept { return _headers.size(); }
  [[nodiscard]] bool empty() const noexcept { return _headers.empty(); }

  [[nodiscard]] const_iterator begin() const noexcept { return _headers.begin(); }
  [[nodiscard]] const_iterator end() const noexcept { return _headers.end(); }

  void clear() noexcept { _headers.clear(); }

 private:
  vector<Header> _headers;
};

}  // namespace junction::http
