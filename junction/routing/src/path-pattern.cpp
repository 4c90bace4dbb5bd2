#include "junction/path-pattern.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "junction/pattern-error.hpp"

namespace junction {

namespace {

constexpr std::string_view kWildcard = "*";
constexpr std::string_view kPathType = "path";
constexpr std::string_view kExtensionType = "oext";

struct CaptureToken {
  std::string_view name;
  std::string_view type;  // empty if no ':type'
  std::size_t endPos;     // position following the closing brace
};

// Parses the "{name[:type]}" starting at 'start' in 'segment', 'offset' being the position of 'segment' in 'pattern'.
CaptureToken ParseCaptureToken(std::string_view pattern, std::string_view segment, std::size_t start,
                               std::size_t offset) {
  const auto closePos = segment.find('}', start);
  if (closePos == std::string_view::npos) {
    throw PatternError(PatternErrorCode::UnterminatedCapture, pattern, offset + start);
  }
  const std::string_view inner = segment.substr(start + 1, closePos - start - 1);
  if (const auto innerOpen = inner.find('{'); innerOpen != std::string_view::npos) {
    throw PatternError(PatternErrorCode::MisplacedBrace, pattern, offset + start + 1 + innerOpen);
  }
  CaptureToken token{inner, {}, closePos + 1};
  if (const auto colonPos = inner.find(':'); colonPos != std::string_view::npos) {
    token.name = inner.substr(0, colonPos);
    token.type = inner.substr(colonPos + 1);
    if (token.type.empty()) {
      throw PatternError(PatternErrorCode::UnknownCaptureType, pattern, offset + start + 1 + colonPos);
    }
  }
  if (token.name.empty()) {
    throw PatternError(PatternErrorCode::EmptyCaptureName, pattern, offset + start);
  }
  return token;
}

std::optional<PathSegment::Constraint> ConstraintOf(std::string_view type) {
  if (type.empty() || type == "str" || type == "s" || type == "string") {
    return PathSegment::Constraint::None;
  }
  if (type == "int") {
    return PathSegment::Constraint::Int;
  }
  if (type == "uint") {
    return PathSegment::Constraint::UInt;
  }
  if (type == "uuid") {
    return PathSegment::Constraint::Uuid;
  }
  return std::nullopt;
}

std::string_view ConstraintToStr(PathSegment::Constraint constraint) {
  switch (constraint) {
    case PathSegment::Constraint::Int:
      return "int";
    case PathSegment::Constraint::UInt:
      return "uint";
    case PathSegment::Constraint::Uuid:
      return "uuid";
    default:
      return {};
  }
}

constexpr bool IsDigit(char ch) noexcept { return ch >= '0' && ch <= '9'; }

constexpr bool IsHexDigit(char ch) noexcept {
  return IsDigit(ch) || (ch >= 'a' && ch <= 'f') || (ch >= 'A' && ch <= 'F');
}

bool IsUInt(std::string_view value) noexcept { return !value.empty() && std::ranges::all_of(value, IsDigit); }

bool IsUuidV4(std::string_view value) noexcept {
  static constexpr std::size_t kUuidLen = 36;
  if (value.size() != kUuidLen) {
    return false;
  }
  for (std::size_t pos = 0; pos < kUuidLen; ++pos) {
    const char ch = value[pos];
    switch (pos) {
      case 8:
      case 13:
      case 18:
      case 23:
        if (ch != '-') {
          return false;
        }
        break;
      case 14:
        if (ch != '4') {
          return false;
        }
        break;
      case 19:
        if (ch != '8' && ch != '9' && ch != 'a' && ch != 'b' && ch != 'A' && ch != 'B') {
          return false;
        }
        break;
      default:
        if (!IsHexDigit(ch)) {
          return false;
        }
        break;
    }
  }
  return true;
}

PathSegment CompileSegment(std::string_view pattern, std::string_view segment, std::size_t offset) {
  PathSegment ret;
  ret.offset = static_cast<uint32_t>(offset);

  const auto openPos = segment.find('{');
  std::size_t pos;
  if (openPos != 0) {
    const std::string_view literal = segment.substr(0, openPos);
    if (const auto closePos = literal.find('}'); closePos != std::string_view::npos) {
      throw PatternError(PatternErrorCode::MisplacedBrace, pattern, offset + closePos);
    }
    if (literal == kWildcard && openPos == std::string_view::npos) {
      ret.kind = PathSegment::Kind::Wildcard;
      return ret;
    }
    ret.text = literal;
    if (openPos == std::string_view::npos) {
      return ret;
    }
    pos = openPos;
  } else {
    const CaptureToken token = ParseCaptureToken(pattern, segment, 0, offset);
    if (token.type == kExtensionType) {
      throw PatternError(PatternErrorCode::MisplacedExtension, pattern, offset);
    }
    ret.text = token.name;
    if (token.type == kPathType) {
      ret.kind = PathSegment::Kind::Wildcard;
    } else {
      const auto constraint = ConstraintOf(token.type);
      if (!constraint) {
        throw PatternError(PatternErrorCode::UnknownCaptureType, pattern, offset);
      }
      ret.kind = PathSegment::Kind::Capture;
      ret.constraint = *constraint;
    }
    pos = token.endPos;
    if (pos == segment.size()) {
      return ret;
    }
    if (segment[pos] != '{') {
      throw PatternError(PatternErrorCode::MisplacedBrace, pattern, offset + pos);
    }
  }

  // only an optional extension may follow the literal or capture starting the segment
  const CaptureToken ext = ParseCaptureToken(pattern, segment, pos, offset);
  if (ext.type != kExtensionType) {
    throw PatternError(PatternErrorCode::MisplacedBrace, pattern, offset + pos);
  }
  if (ret.kind == PathSegment::Kind::Wildcard) {
    throw PatternError(PatternErrorCode::MisplacedExtension, pattern, offset + pos);
  }
  if (ext.endPos != segment.size()) {
    throw PatternError(PatternErrorCode::MisplacedBrace, pattern, offset + ext.endPos);
  }
  ret.extName = ext.name;
  return ret;
}

bool IsNameBound(const PathPattern& segments, std::string_view name) {
  return std::ranges::any_of(segments, [name](const PathSegment& segment) {
    return (segment.kind != PathSegment::Kind::Literal && segment.text == name) || segment.extName == name;
  });
}

}  // namespace

PathPattern ParsePattern(std::string_view pattern) {
  PathPattern segments;
  std::size_t pos = 0;
  while (pos < pattern.size()) {
    auto slashPos = pattern.find('/', pos);
    if (slashPos == std::string_view::npos) {
      slashPos = pattern.size();
    }
    if (slashPos != pos) {
      if (!segments.empty() && segments.back().kind == PathSegment::Kind::Wildcard) {
        throw PatternError(PatternErrorCode::MisplacedWildcard, pattern, segments.back().offset);
      }
      PathSegment segment = CompileSegment(pattern, pattern.substr(pos, slashPos - pos), pos);
      const bool bindsName = segment.kind != PathSegment::Kind::Literal && !segment.text.empty();
      if ((bindsName && IsNameBound(segments, segment.text)) ||
          (!segment.extName.empty() &&
           (IsNameBound(segments, segment.extName) || (bindsName && segment.extName == segment.text)))) {
        throw PatternError(PatternErrorCode::DuplicateCaptureName, pattern, pos);
      }
      segments.push_back(std::move(segment));
    }
    pos = slashPos + 1;
  }
  return segments;
}

bool SatisfiesConstraint(PathSegment::Constraint constraint, std::string_view value) noexcept {
  switch (constraint) {
    case PathSegment::Constraint::Int:
      if (value.starts_with('+') || value.starts_with('-')) {
        value.remove_prefix(1);
      }
      return IsUInt(value);
    case PathSegment::Constraint::UInt:
      return IsUInt(value);
    case PathSegment::Constraint::Uuid:
      return IsUuidV4(value);
    default:
      return !value.empty();
  }
}

std::string JoinPaths(std::string_view base, std::string_view extend) {
  std::string out;
  out.reserve(base.size() + extend.size() + 1U);
  out.append(base);

  const bool baseHasSlash = base.ends_with('/');
  const bool extendHasSlash = extend.starts_with('/');
  if (baseHasSlash && extendHasSlash) {
    out.append(extend.substr(1));
  } else if (baseHasSlash || extendHasSlash) {
    out.append(extend);
  } else {
    out.push_back('/');
    out.append(extend);
  }
  return out;
}

void AppendSegment(const PathSegment& segment, std::string& out) {
  switch (segment.kind) {
    case PathSegment::Kind::Literal:
      out.append(segment.text);
      break;
    case PathSegment::Kind::Capture: {
      out.push_back('{');
      out.append(segment.text);
      const std::string_view type = ConstraintToStr(segment.constraint);
      if (!type.empty()) {
        out.push_back(':');
        out.append(type);
      }
      out.push_back('}');
      break;
    }
    case PathSegment::Kind::Wildcard:
      if (segment.text.empty()) {
        out.append(kWildcard);
      } else {
        out.push_back('{');
        out.append(segment.text);
        out.push_back(':');
        out.append(kPathType);
        out.push_back('}');
      }
      break;
    default:
      break;
  }
  if (!segment.extName.empty()) {
    out.push_back('{');
    out.append(segment.extName);
    out.push_back(':');
    out.append(kExtensionType);
    out.push_back('}');
  }
}

std::string PatternString(std::span<const PathSegment> segments) {
  if (segments.empty()) {
    return std::string(1, '/');
  }
  std::string out;
  for (const PathSegment& segment : segments) {
    out.push_back('/');
    AppendSegment(segment, out);
  }
  return out;
}

}  // namespace junction
