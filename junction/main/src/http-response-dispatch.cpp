#include "junction/http-response-dispatch.hpp"

#include <exception>
#include <string>
#include <string_view>
#include <utility>

#include "junction/dispatch-result.hpp"
#include "junction/endpoint-error.hpp"
#include "junction/http-constants.hpp"
#include "junction/http-method.hpp"
#include "junction/http-response.hpp"
#include "junction/http-status-code.hpp"
#include "junction/log.hpp"
#include "junction/route-tree.hpp"

namespace junction {

namespace {

HttpResponse MakeStatusResponse(http::StatusCode status) {
  HttpResponse response(status);
  response.body(response.reason());
  return response;
}

}  // namespace

HttpResponse MakeNotFoundResponse() { return MakeStatusResponse(http::StatusCodeNotFound); }

HttpResponse MakeMethodNotAllowedResponse(http::MethodBmp allowed, bool withAllowHeader) {
  HttpResponse response = MakeStatusResponse(http::StatusCodeMethodNotAllowed);
  if (withAllowHeader) {
    response.header(http::Allow, http::MethodBmpToStr(allowed));
  }
  return response;
}

HttpResponse MakeNotImplementedResponse() { return MakeStatusResponse(http::StatusCodeNotImplemented); }

HttpResponse MakeEndpointFailureResponse(const std::exception_ptr& error, std::string_view methodToken, std::string_view path,
                                         bool exposeDetails) {
  http::StatusCode status = http::StatusCodeInternalServerError;
  std::string message;
  try {
    std::rethrow_exception(error);
  } catch (const EndpointError& ex) {
    status = ex.status();
    message = ex.what();
  } catch (const std::exception& ex) {
    message = ex.what();
  } catch (...) {
    message = "unknown exception";
  }

  log::error("{} {} failed with status {}: {}", methodToken, path, status, message);

  HttpResponse response(status);
  if (exposeDetails) {
    response.body(std::move(message));
  } else {
    response.body(response.reason());
  }
  return response;
}

void LogRouteTable(const RouteTree& tree) {
  for (const RouteNode* pNode : tree.routeNodes()) {
    const http::MethodBmp methods = pNode->registeredMethods();
    for (http::MethodIdx methodIdx = 0; methodIdx < http::kNbMethods; ++methodIdx) {
      const http::Method method = http::MethodFromIdx(methodIdx);
      if (http::IsMethodSet(methods, method)) {
        log::debug("route {} {}", http::MethodToStr(method), pNode->pattern());
      }
    }
    if (pNode->anyMethodEndpoint() != kNoEndpoint) {
      log::debug("route * {}", pNode->pattern());
    }
  }
}

std::string_view OutcomeToStr(DispatchResult::Outcome outcome) noexcept {
  switch (outcome) {
    case DispatchResult::Outcome::Handled:
      return "Handled";
    case DispatchResult::Outcome::NotFound:
      return "NotFound";
    case DispatchResult::Outcome::MethodNotAllowed:
      return "MethodNotAllowed";
    case DispatchResult::Outcome::EndpointFailed:
      return "EndpointFailed";
    case DispatchResult::Outcome::NotImplemented:
      return "NotImplemented";
    default:
      return "Unknown";
  }
}

}  // namespace junction
