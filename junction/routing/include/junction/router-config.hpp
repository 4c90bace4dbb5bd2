#pragma once

namespace junction {

struct RouterConfig {
  // When true, a HEAD request on a route without HEAD nor match-all-verbs endpoint is dispatched to its GET
  // endpoint. The transport remains in charge of not emitting the body.
  // Default: false (such a request is answered 405)
  bool headFallbackToGet{false};

  // When true, 405 responses carry an 'Allow' header listing the verbs registered on the matched route.
  // Default: true
  bool allowHeaderOnMethodNotAllowed{true};

  // When true, the 500 response built for a failing endpoint carries the exception message as body.
  // Keep it disabled in production as messages may leak internal details.
  // Default: false
  bool exposeErrorDetails{false};

  RouterConfig& withHeadFallbackToGet(bool enable = true);

  RouterConfig& withAllowHeaderOnMethodNotAllowed(bool enable = true);

  RouterConfig& withExposeErrorDetails(bool enable = true);

  bool operator==(const RouterConfig&) const noexcept = default;
};

}  // namespace junction
