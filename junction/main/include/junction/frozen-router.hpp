#pragma once

#include <concepts>
#include <exception>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <utility>

#include "junction/dispatch-result.hpp"
#include "junction/endpoint.hpp"
#include "junction/http-method.hpp"
#include "junction/http-request.hpp"
#include "junction/http-response-dispatch.hpp"
#include "junction/http-response.hpp"
#include "junction/http-status-code.hpp"
#include "junction/middleware.hpp"
#include "junction/request-task.hpp"
#include "junction/route-tree.hpp"
#include "junction/router-config.hpp"
#include "junction/transport-request.hpp"
#include "junction/vector.hpp"

namespace junction {

template <class State>
class Router;

struct RouteDescription {
  std::string_view method;  // "*" for the match-all-verbs endpoint
  std::string_view pattern;
};

// Immutable route table produced by Router::build().
//
// All member functions are const and keep no per-call state in the router, so a FrozenRouter can be shared by
// reference between any number of concurrent dispatches without synchronization. It must outlive the tasks
// returned by handle().
template <class State>
class FrozenRouter {
 public:
  FrozenRouter(const FrozenRouter&) = delete;
  FrozenRouter& operator=(const FrozenRouter&) = delete;

  FrozenRouter(FrozenRouter&&) noexcept = default;
  FrozenRouter& operator=(FrozenRouter&&) noexcept = default;

  ~FrozenRouter() = default;

  [[nodiscard]] const RouterConfig& config() const noexcept { return _config; }

  // Matches 'path' for 'method' without dispatching.
  // Captured parameter keys point into this router, values into 'path'.
  [[nodiscard]] RouteMatch match(http::Method method, std::string_view path) const {
    return _tree.match(method, path, _config.headFallbackToGet);
  }

  // Endpoint selected by a Matched result of match(), nullptr for other results.
  [[nodiscard]] const Endpoint<State>* endpointOf(const RouteMatch& routeMatch) const noexcept {
    return routeMatch.matched() ? _endpoints[routeMatch.endpointIdx].get() : nullptr;
  }

  // Methods accepted for 'path':
  //  - the verbs registered on the matched route, all methods if it has a match-all-verbs endpoint
  //  - all methods if no route matches but a default endpoint is installed
  //  - 0 otherwise
  [[nodiscard]] http::MethodBmp allowedMethods(std::string_view path) const {
    const RouteMatch routeMatch = _tree.match(http::Method::GET, path);
    if (routeMatch.pNode == nullptr) {
      return _defaultEndpoint ? http::kAllMethods : http::MethodBmp{};
    }
    if (routeMatch.pNode->anyMethodEndpoint() != kNoEndpoint) {
      return http::kAllMethods;
    }
    return registeredMethods(*routeMatch.pNode);
  }

  // Registered routes sorted by pattern, then by verb.
  [[nodiscard]] vector<RouteDescription> routes() const {
    vector<RouteDescription> out;
    for (const RouteNode* pNode : _tree.routeNodes()) {
      const http::MethodBmp methods = pNode->registeredMethods();
      for (http::MethodIdx methodIdx = 0; methodIdx < http::kNbMethods; ++methodIdx) {
        const http::Method method = http::MethodFromIdx(methodIdx);
        if (http::IsMethodSet(methods, method)) {
          out.push_back(RouteDescription{http::MethodToStr(method), pNode->pattern()});
        }
      }
      if (pNode->anyMethodEndpoint() != kNoEndpoint) {
        out.push_back(RouteDescription{"*", pNode->pattern()});
      }
    }
    return out;
  }

  // Serves one request: match, build the Request, run the global middleware then the endpoint.
  //
  // Never fails: malformed method tokens give a 501, unmatched paths a 404 (or the default endpoint response),
  // known paths with an unregistered verb a 405, and exceptions thrown by the endpoint chain an error response,
  // the exception itself being available in DispatchResult::error.
  // Method tokens are case-sensitive. A valid token outside http::Method (PROPFIND, QUERY, "get"...) is an
  // extension method, only served by match-all-verbs endpoints and by the default endpoint.
  [[nodiscard]] RequestTask<DispatchResult> handle(TransportRequest transportRequest,
                                                   std::shared_ptr<State> state) const;

  // Same as above for routers without application state.
  [[nodiscard]] RequestTask<DispatchResult> handle(TransportRequest transportRequest) const
    requires std::same_as<State, NoState>
  {
    static const auto kNoState = std::make_shared<NoState>();
    return handle(std::move(transportRequest), kNoState);
  }

 private:
  friend class Router<State>;

  // Built-in endpoint answering 404 or 405, so that global middleware also sees these responses.
  class StatusEndpoint final : public Endpoint<State> {
   public:
    StatusEndpoint(http::StatusCode status, http::MethodBmp allowed, bool withAllowHeader) noexcept
        : _allowed(allowed), _status(status), _withAllowHeader(withAllowHeader) {}

    RequestTask<HttpResponse> call([[maybe_unused]] Request<State>& request) const override {
      if (_status == http::StatusCodeMethodNotAllowed) {
        co_return MakeMethodNotAllowedResponse(_allowed, _withAllowHeader);
      }
      co_return MakeNotFoundResponse();
    }

   private:
    http::MethodBmp _allowed;
    http::StatusCode _status;
    bool _withAllowHeader;
  };

  FrozenRouter(RouterConfig config, RouteTree tree, vector<EndpointPtr<State>> endpoints,
               vector<MiddlewarePtr<State>> middleware, EndpointPtr<State> defaultEndpoint)
      : _config(config),
        _tree(std::move(tree)),
        _endpoints(std::move(endpoints)),
        _middleware(std::move(middleware)),
        _defaultEndpoint(std::move(defaultEndpoint)) {}

  [[nodiscard]] http::MethodBmp registeredMethods(const RouteNode& node) const noexcept {
    http::MethodBmp methods = node.registeredMethods();
    if (_config.headFallbackToGet && http::IsMethodSet(methods, http::Method::GET)) {
      methods = methods | http::Method::HEAD;
    }
    return methods;
  }

  RouterConfig _config;
  RouteTree _tree;
  vector<EndpointPtr<State>> _endpoints;
  vector<MiddlewarePtr<State>> _middleware;
  EndpointPtr<State> _defaultEndpoint;
};

template <class State>
RequestTask<DispatchResult> FrozenRouter<State>::handle(TransportRequest transportRequest,
                                                        std::shared_ptr<State> state) const {
  DispatchResult result;

  if (!http::IsValidMethodToken(transportRequest.methodToken)) {
    result.outcome = DispatchResult::Outcome::NotImplemented;
    result.response = MakeNotImplementedResponse();
    co_return result;
  }

  Request<State> request(std::move(transportRequest.methodToken), std::move(transportRequest.target),
                         std::move(transportRequest.headers), std::move(transportRequest.body), std::move(state));

  const std::optional<http::Method> optMethod = request.method();
  RouteMatch routeMatch = optMethod ? _tree.match(*optMethod, request.path(), _config.headFallbackToGet)
                                    : _tree.matchExtension(request.path());

  const StatusEndpoint statusEndpoint(
      routeMatch.kind == RouteMatch::Kind::MethodNotAllowed ? http::StatusCodeMethodNotAllowed
                                                            : http::StatusCodeNotFound,
      routeMatch.pNode == nullptr ? http::MethodBmp{} : registeredMethods(*routeMatch.pNode),
      _config.allowHeaderOnMethodNotAllowed);

  const Endpoint<State>* pEndpoint = &statusEndpoint;
  switch (routeMatch.kind) {
    case RouteMatch::Kind::Matched:
      pEndpoint = _endpoints[routeMatch.endpointIdx].get();
      result.outcome = DispatchResult::Outcome::Handled;
      break;
    case RouteMatch::Kind::MethodNotAllowed:
      result.outcome = DispatchResult::Outcome::MethodNotAllowed;
      break;
    default:
      if (_defaultEndpoint) {
        pEndpoint = _defaultEndpoint.get();
      }
      result.outcome = DispatchResult::Outcome::NotFound;
      break;
  }

  request.setRouteMatch(std::move(routeMatch.params), routeMatch.remainder);

  try {
    Next<State> chain(std::span<const MiddlewarePtr<State>>(_middleware.data(), _middleware.size()), *pEndpoint);
    result.response = co_await chain(request);
  } catch (...) {
    result.error = std::current_exception();
  }

  if (result.error) {
    result.outcome = DispatchResult::Outcome::EndpointFailed;
    result.response =
        MakeEndpointFailureResponse(result.error, request.methodToken(), request.path(), _config.exposeErrorDetails);
  }
  co_return result;
}

}  // namespace junction
