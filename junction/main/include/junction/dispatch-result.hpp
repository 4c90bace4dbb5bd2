#pragma once

#include <cstdint>
#include <exception>
#include <string_view>

#include "junction/http-response.hpp"

namespace junction {

// What the router hands back to the transport: always a response to serialize, plus how it was obtained.
struct DispatchResult {
  enum class Outcome : std::uint8_t {
    Handled,           // a route matched and its endpoint produced the response
    NotFound,          // no route matched, response is the 404 or comes from the default endpoint
    MethodNotAllowed,  // a route matched the path but not the method, response is a 405
    EndpointFailed,    // the endpoint (or a middleware) threw, response is the error response
    NotImplemented     // malformed method token, response is a 501
  };

  HttpResponse response;
  Outcome outcome{Outcome::Handled};
  // Exception thrown by the endpoint chain when outcome is EndpointFailed.
  std::exception_ptr error;
};

std::string_view OutcomeToStr(DispatchResult::Outcome outcome) noexcept;

}  // namespace junction
