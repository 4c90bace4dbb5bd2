#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "junction/vector.hpp"

namespace junction {

struct PathSegment {
  enum class Kind : std::uint8_t { Literal, Capture, Wildcard };

  // Shape a captured value must have.
  enum class Constraint : std::uint8_t {
    None,  // any non-empty segment ("{id}", "{id:str}", "{id:s}", "{id:string}")
    Int,   // [+-]?[0-9]+
    UInt,  // [0-9]+
    Uuid   // RFC 9562 version 4 UUID, e.g. 3f2504e0-4f89-41d3-9a0c-0305e82c3301
  };

  bool operator==(const PathSegment&) const noexcept = default;

  Kind kind{Kind::Literal};
  Constraint constraint{Constraint::None};
  std::string text;      // literal text, capture name, or tail name ("{rest:path}"), empty for "*"
  std::string extName;   // name of the optional extension suffix "{ext:oext}", empty if none
  uint32_t offset{};     // position of the segment in the source pattern
};

using PathPattern = vector<PathSegment>;

// Compiles a route pattern into its segments.
//
// Syntax:
//   - the pattern is split on '/', empty segments are dropped ("", "/" and "//" all give zero segments)
//   - "{name}" (the whole segment) is a capture binding one non-empty request segment to 'name'
//   - "{name:type}" is a typed capture, type being one of str, s, string (same as no type), int, uint or uuid
//   - "*" as the last segment matches the rest of the path (zero or more segments)
//   - "{name:path}" as the last segment matches the rest of the path (one or more segments) and binds it to 'name'
//   - a literal or a capture may end with "{ext:oext}": an optional ".ext" suffix, "report{ext:oext}" matching
//     both "report" and "report.pdf" (ext=pdf)
//   - anything else is a literal, compared case-sensitively
// There is no escaping: a brace anywhere else is an error.
//
// Throws PatternError.
PathPattern ParsePattern(std::string_view pattern);

// Tells whether 'value' has the shape required by 'constraint'.
bool SatisfiesConstraint(PathSegment::Constraint constraint, std::string_view value) noexcept;

// Joins 'extend' onto 'base' with exactly one '/' at the junction.
//   JoinPaths("", "id") == "/id", JoinPaths("/user/", "/id") == "/user/id", JoinPaths("/user", "") == "/user/"
std::string JoinPaths(std::string_view base, std::string_view extend);

// Splits a concrete request path into its non-empty segments, appended to 'out'.
// The views point into 'path'. 'Container' is any vector-like container of std::string_view.
template <class Container>
void SplitPathSegments(std::string_view path, Container& out) {
  std::size_t pos = 0;
  while (pos < path.size()) {
    auto slashPos = path.find('/', pos);
    if (slashPos == std::string_view::npos) {
      slashPos = path.size();
    }
    if (slashPos != pos) {
      out.push_back(path.substr(pos, slashPos - pos));
    }
    pos = slashPos + 1;
  }
}

// Appends the canonical textual form of 'segment' ("users", "{id}", "{id:int}", "file{ext:oext}", "*" or
// "{rest:path}").
void AppendSegment(const PathSegment& segment, std::string& out);

// Canonical form of a segment list: "/users/{id}/*", or "/" when empty.
std::string PatternString(std::span<const PathSegment> segments);

}  // namespace junction
