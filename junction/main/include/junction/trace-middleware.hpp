#pragma once

#include <chrono>
#include <string_view>

#include "junction/http-response.hpp"
#include "junction/http-status-code.hpp"
#include "junction/log.hpp"
#include "junction/middleware.hpp"
#include "junction/request-task.hpp"

namespace junction {

void LogTraceRequest(log::level::level_enum level, std::string_view methodToken, std::string_view path);

void LogTraceResponse(log::level::level_enum level, std::string_view methodToken, std::string_view path,
                      http::StatusCode status, std::chrono::steady_clock::duration elapsed);

void LogTraceFailure(log::level::level_enum level, std::string_view methodToken, std::string_view path,
                     std::chrono::steady_clock::duration elapsed);

// Logs one line when a request enters the chain and one when its response leaves it:
//   --> GET /users/42
//   <-- GET /users/42: 200 (in 3ms)
template <class State>
class TraceMiddleware final : public Middleware<State> {
 public:
  explicit TraceMiddleware(log::level::level_enum level = log::level::info) noexcept : _level(level) {}

  RequestTask<HttpResponse> apply(Request<State>& request, Next<State> next) const override {
    const auto start = std::chrono::steady_clock::now();
    LogTraceRequest(_level, request.methodToken(), request.path());
    HttpResponse response;
    try {
      response = co_await next(request);
    } catch (...) {
      LogTraceFailure(_level, request.methodToken(), request.path(), std::chrono::steady_clock::now() - start);
      throw;
    }
    LogTraceResponse(_level, request.methodToken(), request.path(), response.status(),
                     std::chrono::steady_clock::now() - start);
    co_return response;
  }

 private:
  log::level::level_enum _level;
};

}  // namespace junction
