#pragma once

#include <functional>
#include <memory>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include "junction/http-request.hpp"
#include "junction/http-response.hpp"
#include "junction/request-task.hpp"

namespace junction {

// Unit of application logic bound to a (pattern, verb) pair.
//
// Endpoints are shared, immutable, by the router and may be called concurrently for different requests.
// Failures are reported by throwing from the coroutine; the router turns them into an error response
// (see EndpointError to choose its status code).
template <class State>
class Endpoint {
 public:
  virtual ~Endpoint() = default;

  [[nodiscard]] virtual RequestTask<HttpResponse> call(Request<State>& request) const = 0;
};

template <class State>
using EndpointPtr = std::shared_ptr<const Endpoint<State>>;

template <class State>
using AsyncHandler = std::function<RequestTask<HttpResponse>(Request<State>&)>;

template <class State>
using SyncHandler = std::function<HttpResponse(Request<State>&)>;

using StaticHandler = std::function<HttpResponse()>;

// Endpoint running a coroutine handler.
template <class State>
class FunctionEndpoint final : public Endpoint<State> {
 public:
  explicit FunctionEndpoint(AsyncHandler<State> handler) : _handler(std::move(handler)) {
    if (!_handler) {
      throw std::invalid_argument("Cannot set empty AsyncHandler");
    }
  }

  RequestTask<HttpResponse> call(Request<State>& request) const override { return _handler(request); }

 private:
  AsyncHandler<State> _handler;
};

// Endpoint running a plain function which completes without suspending.
template <class State>
class SyncEndpoint final : public Endpoint<State> {
 public:
  explicit SyncEndpoint(SyncHandler<State> handler) : _handler(std::move(handler)) {
    if (!_handler) {
      throw std::invalid_argument("Cannot set empty SyncHandler");
    }
  }

  RequestTask<HttpResponse> call(Request<State>& request) const override { co_return _handler(request); }

 private:
  SyncHandler<State> _handler;
};

// Endpoint whose response does not depend on the request.
template <class State>
class StaticEndpoint final : public Endpoint<State> {
 public:
  explicit StaticEndpoint(StaticHandler handler) : _handler(std::move(handler)) {
    if (!_handler) {
      throw std::invalid_argument("Cannot set empty StaticHandler");
    }
  }

  RequestTask<HttpResponse> call([[maybe_unused]] Request<State>& request) const override { co_return _handler(); }

 private:
  StaticHandler _handler;
};

template <class State>
EndpointPtr<State> Async(AsyncHandler<State> handler) {
  return std::make_shared<const FunctionEndpoint<State>>(std::move(handler));
}

template <class State>
EndpointPtr<State> Sync(SyncHandler<State> handler) {
  return std::make_shared<const SyncEndpoint<State>>(std::move(handler));
}

template <class State>
EndpointPtr<State> Static(StaticHandler handler) {
  return std::make_shared<const StaticEndpoint<State>>(std::move(handler));
}

// Wraps any supported handler shape into an endpoint:
//   - an EndpointPtr (or a shared_ptr to a derived endpoint), returned as is
//   - an Endpoint object, moved into a shared one
//   - a callable Request<State>& -> RequestTask<HttpResponse>
//   - a callable Request<State>& -> HttpResponse
//   - a callable () -> HttpResponse
template <class State, class Fn>
EndpointPtr<State> MakeEndpoint(Fn&& fn) {
  using F = std::decay_t<Fn>;
  if constexpr (std::is_convertible_v<F, EndpointPtr<State>>) {
    EndpointPtr<State> endpoint(std::forward<Fn>(fn));
    if (!endpoint) {
      throw std::invalid_argument("Cannot set empty Endpoint");
    }
    return endpoint;
  } else if constexpr (std::is_base_of_v<Endpoint<State>, F>) {
    return std::make_shared<const F>(std::forward<Fn>(fn));
  } else if constexpr (std::is_invocable_r_v<RequestTask<HttpResponse>, F&, Request<State>&>) {
    return Async<State>(AsyncHandler<State>(std::forward<Fn>(fn)));
  } else if constexpr (std::is_invocable_r_v<HttpResponse, F&, Request<State>&>) {
    return Sync<State>(SyncHandler<State>(std::forward<Fn>(fn)));
  } else if constexpr (std::is_invocable_r_v<HttpResponse, F&>) {
    return Static<State>(StaticHandler(std::forward<Fn>(fn)));
  } else {
    static_assert(false, "Unsupported endpoint handler signature");
  }
}

}  // namespace junction
