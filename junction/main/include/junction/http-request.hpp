#pragma once

#include <charconv>
#include <concepts>
#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>

#include "junction/http-header.hpp"
#include "junction/http-method.hpp"
#include "junction/path-param-capture.hpp"
#include "junction/request-body.hpp"
#include "junction/vector.hpp"

namespace junction {

// State type for routers that do not need any shared application state.
using NoState = std::monostate;

// Per-request data handed to endpoints: method, target, headers, single-consumer body and the parameters
// captured by the route that matched. The method token is kept as received, so extension methods (PROPFIND,
// QUERY...) are represented as well as the standard ones.
//
// A request owns its target string and the captured parameters point into it, so requests are neither copyable
// nor movable. They are built in place by the router for the duration of one dispatch.
class HttpRequest {
 public:
  HttpRequest(http::Method method, std::string target, http::HeaderMap headers, RequestBody body);

  // 'methodToken' is taken as is, it is recognized as a standard method only on an exact, case-sensitive match.
  HttpRequest(std::string methodToken, std::string target, http::HeaderMap headers, RequestBody body);

  HttpRequest(const HttpRequest&) = delete;
  HttpRequest& operator=(const HttpRequest&) = delete;
  HttpRequest(HttpRequest&&) = delete;
  HttpRequest& operator=(HttpRequest&&) = delete;

  ~HttpRequest() = default;

  // Standard method of this request, std::nullopt for an extension method.
  [[nodiscard]] std::optional<http::Method> method() const noexcept { return _method; }

  // Method token as received, e.g. "GET" or "PROPFIND".
  [[nodiscard]] std::string_view methodToken() const noexcept { return _methodToken; }

  // Request path, without the query string. Still percent-encoded.
  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  // Query string after the '?', empty if none.
  [[nodiscard]] std::string_view query() const noexcept { return _query; }

  // Part of the path matched by a terminal '*' of the route pattern, empty otherwise.
  [[nodiscard]] std::string_view remainder() const noexcept { return _remainder; }

  [[nodiscard]] const http::HeaderMap& headers() const noexcept { return _headers; }

  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept {
    return _headers.get(name);
  }

  [[nodiscard]] RequestBody& body() noexcept { return _body; }

  // Captured path parameters, in pattern order.
  [[nodiscard]] std::span<const PathParamCapture> params() const noexcept {
    return {_params.data(), _params.size()};
  }

  // Raw (not percent-decoded) value of the path parameter 'name', if captured.
  [[nodiscard]] std::optional<std::string_view> param(std::string_view name) const noexcept;

  // Value of the path parameter 'name' parsed as a decimal integer.
  // Returns std::nullopt if not captured, or if the whole value is not a valid T.
  template <class T>
    requires(std::integral<T> && !std::same_as<T, bool>)
  [[nodiscard]] std::optional<T> param(std::string_view name) const noexcept {
    const auto value = param(name);
    if (!value) {
      return std::nullopt;
    }
    T out{};
    const char* end = value->data() + value->size();
    const auto [ptr, errc] = std::from_chars(value->data(), end, out);
    if (errc != std::errc{} || ptr != end) {
      return std::nullopt;
    }
    return out;
  }

  // Value of the path parameter at position 'pos' in pattern order, if any.
  [[nodiscard]] std::optional<std::string_view> paramAt(std::size_t pos) const noexcept;

  // Called by the router once the route is resolved. Views must point into path() or into the route tree.
  void setRouteMatch(vector<PathParamCapture> params, std::string_view remainder) noexcept {
    _params = std::move(params);
    _remainder = remainder;
  }

 private:
  void splitTarget();

  std::string _methodToken;
  std::string _target;
  std::string_view _path;
  std::string_view _query;
  std::string_view _remainder;
  vector<PathParamCapture> _params;
  http::HeaderMap _headers;
  RequestBody _body;
  std::optional<http::Method> _method;
};

// Request carrying a reference to the process-wide application state shared by all requests.
// Synchronizing accesses to a mutable State is the State's business.
template <class State>
class Request : public HttpRequest {
 public:
  Request(http::Method method, std::string target, http::HeaderMap headers, RequestBody body,
          std::shared_ptr<State> state)
      : HttpRequest(method, std::move(target), std::move(headers), std::move(body)), _state(std::move(state)) {}

  Request(std::string methodToken, std::string target, http::HeaderMap headers, RequestBody body,
          std::shared_ptr<State> state)
      : HttpRequest(std::move(methodToken), std::move(target), std::move(headers), std::move(body)),
        _state(std::move(state)) {}

  [[nodiscard]] State& state() const noexcept { return *_state; }

  [[nodiscard]] const std::shared_ptr<State>& sharedState() const noexcept { return _state; }

 private:
  std::shared_ptr<State> _state;
};

}  // namespace junction
