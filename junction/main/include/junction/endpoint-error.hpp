#pragma once

#include <stdexcept>
#include <string>

#include "junction/http-status-code.hpp"

namespace junction {

// Exception an endpoint may throw to fail with a specific status code.
// Any other exception escaping an endpoint results in a 500 response.
class EndpointError : public std::runtime_error {
 public:
  explicit EndpointError(const std::string& message, http::StatusCode status = http::StatusCodeInternalServerError)
      : std::runtime_error(message), _status(status) {}

  [[nodiscard]] http::StatusCode status() const noexcept { return _status; }

 private:
  http::StatusCode _status;
};

}  // namespace junction
