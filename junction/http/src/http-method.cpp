#include "junction/http-method.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>

#include "junction/tchars.hpp"

namespace junction::http {

std::optional<Method> MethodStrToOptEnum(std::string_view str) {
  switch (str.size()) {
    case 3:  // GET, PUT
      switch (str[0]) {
        case 'G':
          return str == "GET" ? std::optional<Method>(Method::GET) : std::nullopt;
        case 'P':
          return str == "PUT" ? std::optional<Method>(Method::PUT) : std::nullopt;
        default:
          return std::nullopt;
      }

    case 4:  // HEAD, POST
      switch (str[0]) {
        case 'H':
          return str == "HEAD" ? std::optional<Method>(Method::HEAD) : std::nullopt;
        case 'P':
          return str == "POST" ? std::optional<Method>(Method::POST) : std::nullopt;
        default:
          return std::nullopt;
      }

    case 5:  // TRACE, PATCH
      switch (str[0]) {
        case 'T':
          return str == "TRACE" ? std::optional<Method>(Method::TRACE) : std::nullopt;
        case 'P':
          return str == "PATCH" ? std::optional<Method>(Method::PATCH) : std::nullopt;
        default:
          return std::nullopt;
      }

    case 6:  // DELETE
      return str == "DELETE" ? std::optional<Method>(Method::DELETE) : std::nullopt;

    case 7:  // CONNECT, OPTIONS
      switch (str[0]) {
        case 'C':
          return str == "CONNECT" ? std::optional<Method>(Method::CONNECT) : std::nullopt;
        case 'O':
          return str == "OPTIONS" ? std::optional<Method>(Method::OPTIONS) : std::nullopt;
        default:
          return std::nullopt;
      }
    default:
      return std::nullopt;
  }
}

bool IsValidMethodToken(std::string_view token) noexcept {
  return !token.empty() && std::ranges::all_of(token, [](char ch) { return IsTChar(ch); });
}

std::string MethodBmpToStr(MethodBmp methods, std::string_view sep) {
  std::string out;
  for (MethodIdx methodIdx = 0; methodIdx < kNbMethods; ++methodIdx) {
    const Method method = MethodFromIdx(methodIdx);
    if (!IsMethodSet(methods, method)) {
      continue;
    }
    if (!out.empty()) {
      out.append(sep);
    }
    out.append(MethodToStr(method));
  }
  return out;
}

}  // namespace junction::http
