#pragma once

#include <span>
#include <stdexcept>
#include <utility>

#include "junction/endpoint.hpp"
#include "junction/middleware.hpp"
#include "junction/vector.hpp"

namespace junction {

// Endpoint made of a middleware chain in front of another endpoint, itself possibly a ScopeEndpoint.
template <class State>
class ScopeEndpoint final : public Endpoint<State> {
 public:
  ScopeEndpoint(vector<MiddlewarePtr<State>> middleware, EndpointPtr<State> endpoint)
      : _middleware(std::move(middleware)), _endpoint(std::move(endpoint)) {
    if (!_endpoint) {
      throw std::invalid_argument("Cannot build a ScopeEndpoint around an empty Endpoint");
    }
  }

  RequestTask<HttpResponse> call(Request<State>& request) const override {
    return Next<State>(std::span<const MiddlewarePtr<State>>(_middleware.data(), _middleware.size()), *_endpoint)(
        request);
  }

  [[nodiscard]] std::span<const MiddlewarePtr<State>> middleware() const noexcept {
    return {_middleware.data(), _middleware.size()};
  }

 private:
  vector<MiddlewarePtr<State>> _middleware;
  EndpointPtr<State> _endpoint;
};

// Builder of ScopeEndpoint:
//   router.at("/admin").all(Scope<AppState>().with(requireAuth).with(TraceMiddleware<AppState>()).to(adminApi));
// Middleware run in the order they were added.
template <class State>
class Scope {
 public:
  template <class Fn>
  Scope& with(Fn&& middleware) & {
    _middleware.push_back(MakeMiddleware<State>(std::forward<Fn>(middleware)));
    return *this;
  }

  template <class Fn>
  Scope&& with(Fn&& middleware) && {
    _middleware.push_back(MakeMiddleware<State>(std::forward<Fn>(middleware)));
    return std::move(*this);
  }

  // Terminates the scope with given endpoint (any shape accepted by MakeEndpoint).
  template <class Fn>
  [[nodiscard]] EndpointPtr<State> to(Fn&& endpoint) && {
    return std::make_shared<const ScopeEndpoint<State>>(std::move(_middleware),
                                                        MakeEndpoint<State>(std::forward<Fn>(endpoint)));
  }

 private:
  vector<MiddlewarePtr<State>> _middleware;
};

}  // namespace junction
