#pragma once

#include <exception>
#include <string_view>

#include "junction/http-method.hpp"
#include "junction/http-response.hpp"

namespace junction {

class RouteTree;

HttpResponse MakeNotFoundResponse();

// 405 response. 'allowed' is rendered in an Allow header when 'withAllowHeader' is set.
HttpResponse MakeMethodNotAllowedResponse(http::MethodBmp allowed, bool withAllowHeader);

// 501 response, for request lines whose method is not a valid token.
HttpResponse MakeNotImplementedResponse();

// Logs the failure of the endpoint serving 'methodToken' 'path' and builds its response.
// EndpointError gives its status code, any other exception gives 500. The exception message becomes the body
// only if 'exposeDetails' is set, the reason phrase is used otherwise.
HttpResponse MakeEndpointFailureResponse(const std::exception_ptr& error, std::string_view methodToken, std::string_view path,
                                         bool exposeDetails);

// Logs the route table at debug level, one line per verb and pattern.
void LogRouteTable(const RouteTree& tree);

}  // namespace junction
