#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace junction {

enum class PatternErrorCode : std::uint8_t {
  EmptyCaptureName,        // "{}"
  UnterminatedCapture,     // "{id" (an opening brace never closed in its segment)
  MisplacedBrace,          // brace not forming a whole "{name}" segment, e.g. "v{id}" or "{a}b" or "a}"
  DuplicateCaptureName,    // same capture name twice in one pattern
  ConflictingCaptureName,  // different capture names or types registered at the same tree position
  MisplacedWildcard,       // '*' or "{name:path}" segment which is not the last one
  UnknownCaptureType,      // "{id:float}", "{id:}"
  MisplacedExtension       // "{ext:oext}" not ending a literal or a capture, e.g. "/{ext:oext}" or "{p:path}{e:oext}"
};

std::string_view PatternErrorCodeToStr(PatternErrorCode code) noexcept;

// Malformed route pattern, raised while the route table is built.
// what() names the pattern and the byte offset of the offending segment.
class PatternError : public std::invalid_argument {
 public:
  PatternError(PatternErrorCode code, std::string_view pattern, std::size_t offset);

  [[nodiscard]] PatternErrorCode code() const noexcept { return _code; }

  [[nodiscard]] std::string_view pattern() const noexcept { return _pattern; }

  [[nodiscard]] std::size_t offset() const noexcept { return _offset; }

 private:
  std::string _pattern;
  std::size_t _offset;
  PatternErrorCode _code;
};

}  // namespace junction
