#pragma once

#include <cstdint>

namespace junction {

// RFC 9110 token characters:
//   tchar = "!" / "#" / "$" / "%" / "&" / "'" / "*" / "+" / "-" / "." / "^" / "_" / "`" / "|" / "~" / DIGIT / ALPHA
constexpr bool IsTChar(unsigned char uc) noexcept {
  // [0, 63] then [64, 127]
  constexpr uint64_t kBitmap[2] = {
      (1ULL << '!') | (1ULL << '#') | (1ULL << '$') | (1ULL << '%') | (1ULL << '&') | (1ULL << '\'') | (1ULL << '*') |
          (1ULL << '+') | (1ULL << '-') | (1ULL << '.') | (0x3FFULL << '0'),

      (0x3FFFFFFULL << ('A' - 64)) | (1ULL << ('^' - 64)) | (1ULL << ('_' - 64)) | (0x3FFFFFFULL << ('a' - 64)) |
          (1ULL << ('`' - 64)) | (1ULL << ('|' - 64)) | (1ULL << ('~' - 64))};

  return uc < 128U && ((kBitmap[uc >> 6] >> (uc & 63U)) & 1U) != 0U;
}

constexpr bool IsTChar(char ch) noexcept { return IsTChar(static_cast<unsigned char>(ch)); }

}  // namespace junction
