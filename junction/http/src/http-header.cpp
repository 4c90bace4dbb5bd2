#include "junction/http-header.hpp"

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <utility>

#include "junction/string-equal-ignore-case.hpp"
#include "junction/tchars.hpp"

namespace junction::http {

namespace {

void CheckHeader(std::string_view name, std::string_view value) {
  if (!IsValidHeaderName(name)) {
    throw std::invalid_argument("HTTP header name is invalid");
  }
  if (!IsValidHeaderValue(value)) {
    throw std::invalid_argument("HTTP header value is invalid");
  }
}

}  // namespace

bool IsValidHeaderName(std::string_view name) noexcept {
  return !name.empty() && std::ranges::all_of(name, [](char ch) { return IsTChar(ch); });
}

bool IsValidHeaderValue(std::string_view value) noexcept {
  return std::ranges::all_of(value, [](unsigned char ch) {
    if (ch == '\t') {
      return true;
    }
    return ch >= 0x20 && ch <= 0x7E;
  });
}

HeaderMap::HeaderMap(std::initializer_list<std::pair<std::string_view, std::string_view>> headers) {
  _headers.reserve(headers.size());
  for (const auto& [name, value] : headers) {
    add(name, value);
  }
}

void HeaderMap::add(std::string_view name, std::string_view value) {
  CheckHeader(name, value);
  _headers.emplace_back(std::string(name), std::string(value));
}

void HeaderMap::set(std::string_view name, std::string_view value) {
  CheckHeader(name, value);
  auto it = std::ranges::find_if(_headers, [name](const Header& header) { return CaseInsensitiveEqual(header.name, name); });
  if (it == _headers.end()) {
    _headers.emplace_back(std::string(name), std::string(value));
    return;
  }
  it->value.assign(value);
  // drop later duplicates
  const auto firstPos = static_cast<std::size_t>(it - _headers.begin());
  auto newEnd = std::remove_if(_headers.begin() + firstPos + 1, _headers.end(),
                               [name](const Header& header) { return CaseInsensitiveEqual(header.name, name); });
  _headers.erase(newEnd, _headers.end());
}

std::size_t HeaderMap::erase(std::string_view name) {
  const auto oldSize = _headers.size();
  auto newEnd = std::remove_if(_headers.begin(), _headers.end(),
                               [name](const Header& header) { return CaseInsensitiveEqual(header.name, name); });
  _headers.erase(newEnd, _headers.end());
  return oldSize - _headers.size();
}

std::optional<std::string_view> HeaderMap::get(std::string_view name) const noexcept {
  auto it = std::ranges::find_if(_headers, [name](const Header& header) { return CaseInsensitiveEqual(header.name, name); });
  if (it == _headers.end()) {
    return std::nullopt;
  }
  return std::string_view(it->value);
}

}  // namespace junction::http
