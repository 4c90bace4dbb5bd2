#pragma once

#include <string>

#include "junction/http-header.hpp"
#include "junction/request-body.hpp"

namespace junction {

// What the transport hands to the router for each inbound request.
struct TransportRequest {
  std::string methodToken;  // as received, e.g. "GET"
  std::string target;       // path with optional query string, still percent-encoded
  http::HeaderMap headers;
  RequestBody body;
};

}  // namespace junction
