#pragma once

#include <functional>
#include <memory>
#include <span>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include "junction/endpoint.hpp"
#include "junction/http-request.hpp"
#include "junction/http-response.hpp"
#include "junction/request-task.hpp"

namespace junction {

template <class State>
class Middleware;

template <class State>
using MiddlewarePtr = std::shared_ptr<const Middleware<State>>;

// Remainder of a middleware chain: the middleware not run yet, then the endpoint.
// Cheap to copy, it only refers to the chain which is owned by the router or by a ScopeEndpoint.
template <class State>
class Next {
 public:
  Next(std::span<const MiddlewarePtr<State>> remaining, const Endpoint<State>& endpoint) noexcept
      : _remaining(remaining), _pEndpoint(&endpoint) {}

  // Runs the rest of the chain for 'request'.
  [[nodiscard]] RequestTask<HttpResponse> operator()(Request<State>& request) const;

 private:
  std::span<const MiddlewarePtr<State>> _remaining;
  const Endpoint<State>* _pEndpoint;
};

// Code wrapping endpoints: it can inspect or alter the request, call 'next' zero or one time, and inspect or
// replace the response. Not calling 'next' short-circuits the rest of the chain.
template <class State>
class Middleware {
 public:
  virtual ~Middleware() = default;

  [[nodiscard]] virtual RequestTask<HttpResponse> apply(Request<State>& request, Next<State> next) const = 0;
};

template <class State>
using MiddlewareHandler = std::function<RequestTask<HttpResponse>(Request<State>&, Next<State>)>;

template <class State>
class FunctionMiddleware final : public Middleware<State> {
 public:
  explicit FunctionMiddleware(MiddlewareHandler<State> handler) : _handler(std::move(handler)) {
    if (!_handler) {
      throw std::invalid_argument("Cannot set empty MiddlewareHandler");
    }
  }

  RequestTask<HttpResponse> apply(Request<State>& request, Next<State> next) const override {
    return _handler(request, next);
  }

 private:
  MiddlewareHandler<State> _handler;
};

template <class State>
RequestTask<HttpResponse> Next<State>::operator()(Request<State>& request) const {
  if (_remaining.empty()) {
    return _pEndpoint->call(request);
  }
  return _remaining.front()->apply(request, Next(_remaining.subspan(1), *_pEndpoint));
}

// Wraps a MiddlewarePtr (returned as is), a Middleware object (shared copy) or a callable (Request<State>&, Next<State>) -> RequestTask<HttpResponse>.
template <class State, class Fn>
MiddlewarePtr<State> MakeMiddleware(Fn&& fn) {
  using F = std::decay_t<Fn>;
  if constexpr (std::is_convertible_v<F, MiddlewarePtr<State>>) {
    MiddlewarePtr<State> middleware(std::forward<Fn>(fn));
    if (!middleware) {
      throw std::invalid_argument("Cannot set empty Middleware");
    }
    return middleware;
  } else if constexpr (std::is_base_of_v<Middleware<State>, F>) {
    return std::make_shared<const F>(std::forward<Fn>(fn));
  } else if constexpr (std::is_invocable_r_v<RequestTask<HttpResponse>, F&, Request<State>&, Next<State>>) {
    return std::make_shared<const FunctionMiddleware<State>>(MiddlewareHandler<State>(std::forward<Fn>(fn)));
  } else {
    static_assert(false, "Unsupported middleware handler signature");
  }
}

}  // namespace junction
