#include "junction/pattern-error.hpp"

#include <cstddef>
#include <format>
#include <stdexcept>
#include <string_view>

namespace junction {

std::string_view PatternErrorCodeToStr(PatternErrorCode code) noexcept {
  switch (code) {
    case PatternErrorCode::EmptyCaptureName:
      return "empty capture name";
    case PatternErrorCode::UnterminatedCapture:
      return "unterminated capture";
    case PatternErrorCode::MisplacedBrace:
      return "brace outside of a whole-segment capture";
    case PatternErrorCode::DuplicateCaptureName:
      return "duplicate capture name";
    case PatternErrorCode::ConflictingCaptureName:
      return "capture name conflicts with an existing route";
    case PatternErrorCode::MisplacedWildcard:
      return "wildcard must be the last segment";
    case PatternErrorCode::UnknownCaptureType:
      return "unknown capture type";
    case PatternErrorCode::MisplacedExtension:
      return "optional extension must follow a literal or a capture";
    default:
      return "unknown pattern error";
  }
}

PatternError::PatternError(PatternErrorCode code, std::string_view pattern, std::size_t offset)
    : std::invalid_argument(
          std::format("Invalid route pattern '{}' at offset {}: {}", pattern, offset, PatternErrorCodeToStr(code))),
      _pattern(pattern),
      _offset(offset),
      _code(code) {}

}  // namespace junction
