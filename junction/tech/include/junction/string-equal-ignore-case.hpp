#pragma once

#include <string_view>

#include "junction/toupperlower.hpp"

namespace junction {

// ASCII-only comparison, which is all HTTP tokens and header names need.
constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }

  const char* pLhs = lhs.data();
  const char* pRhs = rhs.data();
  const char* end = pLhs + lhs.size();

  for (; pLhs != end; ++pLhs, ++pRhs) {
    if (tolower(*pLhs) != tolower(*pRhs)) {
      return false;
    }
  }
  return true;
}

struct CaseInsensitiveEqualFunc {
  constexpr bool operator()(std::string_view lhs, std::string_view rhs) const noexcept {
    return CaseInsensitiveEqual(lhs, rhs);
  }
};

}  // namespace junction
