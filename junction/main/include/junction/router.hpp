#pragma once

#include <cstddef>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "junction/endpoint.hpp"
#include "junction/frozen-router.hpp"
#include "junction/http-method.hpp"
#include "junction/http-request.hpp"
#include "junction/http-response-dispatch.hpp"
#include "junction/log.hpp"
#include "junction/middleware.hpp"
#include "junction/path-pattern.hpp"
#include "junction/route-tree.hpp"
#include "junction/router-config.hpp"
#include "junction/vector.hpp"

namespace junction {

template <class State>
class Router;

// Position in the route tree of a Router being built, obtained from Router::at() or RoutePath::at().
//
// Paths are cheap handles: they only refer to their Router which must outlive them. Nested paths are joined
// with JoinPaths, so that router.at("/a").at("/b") and router.at("/a/b") designate the same node.
// Once the Router is built, any mutation through a path throws std::logic_error.
template <class State = NoState>
class RoutePath {
 public:
  // Extends this path with 'pattern', creating missing nodes.
  // Throws PatternError if 'pattern' is invalid or conflicts with an existing capture name,
  // std::logic_error if the router was already built.
  [[nodiscard]] RoutePath at(std::string_view pattern) const {
    _pRouter->checkNotFrozen();
    std::string fullPattern = JoinPaths(_prefix, pattern);
    PathPattern segments = ParsePattern(fullPattern);
    std::span<const PathSegment> added(segments.data(), segments.size());
    RouteNode& node = _pRouter->_tree.insert(*_pNode, added.subspan(_depth), fullPattern);
    return RoutePath(*_pRouter, node, std::move(fullPattern), segments.size());
  }

  // Registers 'endpoint' (any shape accepted by MakeEndpoint) for 'method' on this path.
  // A previous endpoint registered for the same verb is replaced.
  template <class Fn>
  RoutePath& method(http::Method verb, Fn&& endpoint) {
    _pRouter->setMethodEndpoint(*_pNode, verb, MakeEndpoint<State>(std::forward<Fn>(endpoint)));
    return *this;
  }

  // Registers 'endpoint' for all verbs not registered explicitly on this path.
  template <class Fn>
  RoutePath& all(Fn&& endpoint) {
    _pRouter->setAnyMethodEndpoint(*_pNode, MakeEndpoint<State>(std::forward<Fn>(endpoint)));
    return *this;
  }

  template <class Fn>
  RoutePath& get(Fn&& endpoint) {
    return method(http::Method::GET, std::forward<Fn>(endpoint));
  }

  template <class Fn>
  RoutePath& head(Fn&& endpoint) {
    return method(http::Method::HEAD, std::forward<Fn>(endpoint));
  }

  template <class Fn>
  RoutePath& post(Fn&& endpoint) {
    return method(http::Method::POST, std::forward<Fn>(endpoint));
  }

  template <class Fn>
  RoutePath& put(Fn&& endpoint) {
    return method(http::Method::PUT, std::forward<Fn>(endpoint));
  }

  template <class Fn>
  RoutePath& del(Fn&& endpoint) {
    return method(http::Method::DELETE, std::forward<Fn>(endpoint));
  }

  template <class Fn>
  RoutePath& connect(Fn&& endpoint) {
    return method(http::Method::CONNECT, std::forward<Fn>(endpoint));
  }

  template <class Fn>
  RoutePath& options(Fn&& endpoint) {
    return method(http::Method::OPTIONS, std::forward<Fn>(endpoint));
  }

  template <class Fn>
  RoutePath& trace(Fn&& endpoint) {
    return method(http::Method::TRACE, std::forward<Fn>(endpoint));
  }

  template <class Fn>
  RoutePath& patch(Fn&& endpoint) {
    return method(http::Method::PATCH, std::forward<Fn>(endpoint));
  }

  // Pattern as typed by the user, joined with its parents.
  [[nodiscard]] std::string_view pattern() const noexcept { return _prefix; }

  [[nodiscard]] const RouteNode& node() const noexcept { return *_pNode; }

 private:
  friend class Router<State>;

  RoutePath(Router<State>& router, RouteNode& node, std::string prefix, std::size_t depth)
      : _prefix(std::move(prefix)), _pRouter(&router), _pNode(&node), _depth(depth) {}

  std::string _prefix;
  Router<State>* _pRouter;
  RouteNode* _pNode;
  std::size_t _depth;
};

// Mutable routing table, configured during a single-threaded setup phase then frozen by build():
//
//   Router<AppState> router;
//   auto users = router.at("/users");
//   users.get(listUsers).post(createUser);
//   users.at("/{id}").get(getUser).del(deleteUser);
//   router.with(TraceMiddleware<AppState>());
//   FrozenRouter<AppState> frozen = std::move(router).build();
//
// Each (node, verb) pair holds at most one endpoint, the last registered one.
template <class State = NoState>
class Router {
 public:
  Router() = default;

  explicit Router(RouterConfig config) : _config(config) {}

  Router(const Router&) = delete;
  Router& operator=(const Router&) = delete;

  // RoutePath objects refer to the router, it cannot move while being built.
  Router(Router&&) = delete;
  Router& operator=(Router&&) = delete;

  ~Router() = default;

  [[nodiscard]] const RouterConfig& config() const noexcept { return _config; }

  // Path to the node of 'pattern', created if needed. See RoutePath::at.
  [[nodiscard]] RoutePath<State> at(std::string_view pattern) { return root().at(pattern); }

  // Path to the root node "/".
  [[nodiscard]] RoutePath<State> root() noexcept { return RoutePath<State>(*this, _tree.root(), std::string(), 0); }

  // Appends a global middleware, run for every request, including 404 and 405 answers.
  // Global middleware run in the order they were added, before scope middleware.
  template <class Fn>
  Router& with(Fn&& middleware) {
    checkNotFrozen();
    _middleware.push_back(MakeMiddleware<State>(std::forward<Fn>(middleware)));
    return *this;
  }

  // Installs the endpoint answering requests whose path matches no route, instead of the built-in 404.
  template <class Fn>
  Router& setDefault(Fn&& endpoint) {
    checkNotFrozen();
    _defaultEndpoint = MakeEndpoint<State>(std::forward<Fn>(endpoint));
    return *this;
  }

  // Freezes the routing table. The Router is left empty and refuses any further mutation, including through
  // RoutePath objects obtained before.
  [[nodiscard]] FrozenRouter<State> build() && {
    checkNotFrozen();
    _frozen = true;
    LogRouteTable(_tree);
    FrozenRouter<State> frozen(_config, std::move(_tree), std::move(_endpoints), std::move(_middleware),
                               std::move(_defaultEndpoint));
    _tree = RouteTree();
    _endpoints.clear();
    _middleware.clear();
    return frozen;
  }

 private:
  friend class RoutePath<State>;

  void checkNotFrozen() const {
    if (_frozen) {
      throw std::logic_error("Router already built, its routes cannot be modified anymore");
    }
  }

  void setMethodEndpoint(RouteNode& node, http::Method method, EndpointPtr<State> endpoint) {
    checkNotFrozen();
    const EndpointIdx prevIdx = node.endpointFor(method);
    if (prevIdx != kNoEndpoint) {
      log::warn("Overwriting existing endpoint for {} {}", http::MethodToStr(method), node.pattern());
      _endpoints[prevIdx] = std::move(endpoint);
      return;
    }
    RouteTree::setEndpoint(node, method, pushEndpoint(std::move(endpoint)));
  }

  void setAnyMethodEndpoint(RouteNode& node, EndpointPtr<State> endpoint) {
    checkNotFrozen();
    const EndpointIdx prevIdx = node.anyMethodEndpoint();
    if (prevIdx != kNoEndpoint) {
      log::warn("Overwriting existing endpoint for * {}", node.pattern());
      _endpoints[prevIdx] = std::move(endpoint);
      return;
    }
    RouteTree::setAnyMethodEndpoint(node, pushEndpoint(std::move(endpoint)));
  }

  EndpointIdx pushEndpoint(EndpointPtr<State> endpoint) {
    const auto endpointIdx = static_cast<EndpointIdx>(_endpoints.size());
    _endpoints.push_back(std::move(endpoint));
    return endpointIdx;
  }

  RouterConfig _config;
  RouteTree _tree;
  vector<EndpointPtr<State>> _endpoints;
  vector<MiddlewarePtr<State>> _middleware;
  EndpointPtr<State> _defaultEndpoint;
  bool _frozen{false};
};

}  // namespace junction
