#include "junction/trace-middleware.hpp"

#include <chrono>
#include <string_view>

#include "junction/http-status-code.hpp"
#include "junction/log.hpp"

namespace junction {

void LogTraceRequest(log::level::level_enum level, std::string_view methodToken, std::string_view path) {
  log::log(level, "--> {} {}", methodToken, path);
}

void LogTraceResponse(log::level::level_enum level, std::string_view methodToken, std::string_view path,
                      http::StatusCode status, std::chrono::steady_clock::duration elapsed) {
  log::log(level, "<-- {} {}: {} (in {}ms)", methodToken, path, status,
           std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
}

void LogTraceFailure(log::level::level_enum level, std::string_view methodToken, std::string_view path,
                     std::chrono::steady_clock::duration elapsed) {
  log::log(level, "<-- {} {}: failed (in {}ms)", methodToken, path,
           std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
}

}  // namespace junction
