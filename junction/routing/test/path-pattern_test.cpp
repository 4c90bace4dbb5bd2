#include "junction/path-pattern.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

#include "junction/pattern-error.hpp"
#include "junction/smallvector.hpp"
#include "junction/vector.hpp"

namespace junction {

namespace {

PatternErrorCode ErrorCodeOf(std::string_view pattern) {
  try {
    (void)ParsePattern(pattern);
  } catch (const PatternError& ex) {
    return ex.code();
  }
  ADD_FAILURE() << "pattern '" << pattern << "' should have been rejected";
  return PatternErrorCode::MisplacedBrace;
}

std::string Canonical(std::string_view pattern) {
  const PathPattern segments = ParsePattern(pattern);
  return PatternString(std::span<const PathSegment>(segments.data(), segments.size()));
}

}  // namespace

TEST(PathPattern, LiteralsAndCaptures) {
  const PathPattern segments = ParsePattern("/users/{id}/Posts");
  ASSERT_EQ(segments.size(), 3U);
  EXPECT_EQ(segments[0].kind, PathSegment::Kind::Literal);
  EXPECT_EQ(segments[0].text, "users");
  EXPECT_EQ(segments[1].kind, PathSegment::Kind::Capture);
  EXPECT_EQ(segments[1].text, "id");
  EXPECT_EQ(segments[1].offset, 7U);
  EXPECT_EQ(segments[2].kind, PathSegment::Kind::Literal);
  EXPECT_EQ(segments[2].text, "Posts");
}

TEST(PathPattern, EmptySegmentsAreDropped) {
  EXPECT_TRUE(ParsePattern("").empty());
  EXPECT_TRUE(ParsePattern("/").empty());
  EXPECT_TRUE(ParsePattern("//").empty());
  EXPECT_EQ(Canonical("//a///b/"), "/a/b");
  EXPECT_EQ(Canonical("a/b"), "/a/b");
}

TEST(PathPattern, TerminalWildcard) {
  const PathPattern segments = ParsePattern("/static/*");
  ASSERT_EQ(segments.size(), 2U);
  EXPECT_EQ(segments[1].kind, PathSegment::Kind::Wildcard);
  EXPECT_EQ(Canonical("/static/*/"), "/static/*");
  // a star inside a segment is a plain literal
  EXPECT_EQ(ParsePattern("/a*b")[0].kind, PathSegment::Kind::Literal);
}

TEST(PathPattern, TypedCaptures) {
  const PathPattern segments = ParsePattern("/{a:int}/{b:uint}/{c:uuid}/{d:str}/{e:s}/{f:string}");
  ASSERT_EQ(segments.size(), 6U);
  EXPECT_EQ(segments[0].constraint, PathSegment::Constraint::Int);
  EXPECT_EQ(segments[0].text, "a");
  EXPECT_EQ(segments[1].constraint, PathSegment::Constraint::UInt);
  EXPECT_EQ(segments[2].constraint, PathSegment::Constraint::Uuid);
  for (std::size_t pos = 3; pos < segments.size(); ++pos) {
    EXPECT_EQ(segments[pos].kind, PathSegment::Kind::Capture);
    EXPECT_EQ(segments[pos].constraint, PathSegment::Constraint::None);
  }
  EXPECT_EQ(Canonical("/{a:int}/{b:uint}/{c:uuid}/{d:str}/{e:s}/{f:string}"),
            "/{a:int}/{b:uint}/{c:uuid}/{d}/{e}/{f}");
}

TEST(PathPattern, NamedTail) {
  const PathPattern segments = ParsePattern("/static/{file:path}");
  ASSERT_EQ(segments.size(), 2U);
  EXPECT_EQ(segments[1].kind, PathSegment::Kind::Wildcard);
  EXPECT_EQ(segments[1].text, "file");
  EXPECT_EQ(Canonical("/static/{file:path}/"), "/static/{file:path}");
  EXPECT_EQ(ErrorCodeOf("/{file:path}/x"), PatternErrorCode::MisplacedWildcard);
}

TEST(PathPattern, OptionalExtension) {
  PathPattern segments = ParsePattern("/report{fmt:oext}");
  ASSERT_EQ(segments.size(), 1U);
  EXPECT_EQ(segments[0].kind, PathSegment::Kind::Literal);
  EXPECT_EQ(segments[0].text, "report");
  EXPECT_EQ(segments[0].extName, "fmt");

  segments = ParsePattern("/pages/{n:uint}{fmt:oext}");
  ASSERT_EQ(segments.size(), 2U);
  EXPECT_EQ(segments[1].kind, PathSegment::Kind::Capture);
  EXPECT_EQ(segments[1].constraint, PathSegment::Constraint::UInt);
  EXPECT_EQ(segments[1].extName, "fmt");
  EXPECT_EQ(Canonical("/pages/{n:uint}{fmt:oext}"), "/pages/{n:uint}{fmt:oext}");
  EXPECT_EQ(Canonical("/a/{id:string}{e:oext}"), "/a/{id}{e:oext}");
}

TEST(PathPattern, TypedCaptureErrors) {
  EXPECT_EQ(ErrorCodeOf("/{id:float}"), PatternErrorCode::UnknownCaptureType);
  EXPECT_EQ(ErrorCodeOf("/{id:INT}"), PatternErrorCode::UnknownCaptureType);
  EXPECT_EQ(ErrorCodeOf("/{id:}"), PatternErrorCode::UnknownCaptureType);
  EXPECT_EQ(ErrorCodeOf("/{:int}"), PatternErrorCode::EmptyCaptureName);
  EXPECT_EQ(ErrorCodeOf("/{e:oext}"), PatternErrorCode::MisplacedExtension);
  EXPECT_EQ(ErrorCodeOf("/{p:path}{e:oext}"), PatternErrorCode::MisplacedExtension);
  EXPECT_EQ(ErrorCodeOf("/a{e:oext}b"), PatternErrorCode::MisplacedBrace);
  EXPECT_EQ(ErrorCodeOf("/a{e:oext}{f:oext}"), PatternErrorCode::MisplacedBrace);
  EXPECT_EQ(ErrorCodeOf("/{id}{e:int}"), PatternErrorCode::MisplacedBrace);
  EXPECT_EQ(ErrorCodeOf("/{id}{id:oext}"), PatternErrorCode::DuplicateCaptureName);
  EXPECT_EQ(ErrorCodeOf("/{a}/x{a:oext}"), PatternErrorCode::DuplicateCaptureName);
  EXPECT_EQ(ErrorCodeOf("/{a:int}/{a:path}"), PatternErrorCode::DuplicateCaptureName);
}

TEST(PathPattern, SatisfiesConstraint) {
  using Constraint = PathSegment::Constraint;
  EXPECT_TRUE(SatisfiesConstraint(Constraint::None, "anything.at-all"));
  EXPECT_FALSE(SatisfiesConstraint(Constraint::None, ""));

  EXPECT_TRUE(SatisfiesConstraint(Constraint::Int, "42"));
  EXPECT_TRUE(SatisfiesConstraint(Constraint::Int, "-42"));
  EXPECT_TRUE(SatisfiesConstraint(Constraint::Int, "+0"));
  EXPECT_FALSE(SatisfiesConstraint(Constraint::Int, "-"));
  EXPECT_FALSE(SatisfiesConstraint(Constraint::Int, "4x"));
  EXPECT_FALSE(SatisfiesConstraint(Constraint::Int, "1.5"));

  EXPECT_TRUE(SatisfiesConstraint(Constraint::UInt, "007"));
  EXPECT_FALSE(SatisfiesConstraint(Constraint::UInt, "-1"));
  EXPECT_FALSE(SatisfiesConstraint(Constraint::UInt, ""));

  EXPECT_TRUE(SatisfiesConstraint(Constraint::Uuid, "3f2504e0-4f89-41d3-9a0c-0305e82c3301"));
  EXPECT_TRUE(SatisfiesConstraint(Constraint::Uuid, "3F2504E0-4F89-41D3-BA0C-0305E82C3301"));
  // version must be 4, variant one of 8, 9, a, b
  EXPECT_FALSE(SatisfiesConstraint(Constraint::Uuid, "3f2504e0-4f89-11d3-9a0c-0305e82c3301"));
  EXPECT_FALSE(SatisfiesConstraint(Constraint::Uuid, "3f2504e0-4f89-41d3-ca0c-0305e82c3301"));
  EXPECT_FALSE(SatisfiesConstraint(Constraint::Uuid, "3f2504e04f8941d39a0c0305e82c3301"));
  EXPECT_FALSE(SatisfiesConstraint(Constraint::Uuid, "3f2504e0-4f89-41d3-9a0c-0305e82c330g"));
}

TEST(PathPattern, Errors) {
  EXPECT_EQ(ErrorCodeOf("/users/{}"), PatternErrorCode::EmptyCaptureName);
  EXPECT_EQ(ErrorCodeOf("/users/{id"), PatternErrorCode::UnterminatedCapture);
  EXPECT_EQ(ErrorCodeOf("/users/{id/x}"), PatternErrorCode::UnterminatedCapture);
  EXPECT_EQ(ErrorCodeOf("/v{version}"), PatternErrorCode::MisplacedBrace);
  EXPECT_EQ(ErrorCodeOf("/{a}b"), PatternErrorCode::MisplacedBrace);
  EXPECT_EQ(ErrorCodeOf("/a}"), PatternErrorCode::MisplacedBrace);
  EXPECT_EQ(ErrorCodeOf("/{a{b}"), PatternErrorCode::MisplacedBrace);
  EXPECT_EQ(ErrorCodeOf("/{id}/x/{id}"), PatternErrorCode::DuplicateCaptureName);
  EXPECT_EQ(ErrorCodeOf("/files/*/meta"), PatternErrorCode::MisplacedWildcard);
}

TEST(PathPattern, ErrorPointsToOffendingLocation) {
  try {
    (void)ParsePattern("/users/{}");
    FAIL() << "expected PatternError";
  } catch (const PatternError& ex) {
    EXPECT_EQ(ex.pattern(), "/users/{}");
    EXPECT_EQ(ex.offset(), 7U);
    EXPECT_NE(std::string_view(ex.what()).find("/users/{}"), std::string_view::npos);
    EXPECT_NE(std::string_view(ex.what()).find("offset 7"), std::string_view::npos);
  }
}

TEST(PathPattern, PatternErrorIsAnInvalidArgument) {
  EXPECT_THROW((void)ParsePattern("/{}"), std::invalid_argument);
}

TEST(PathPattern, CanonicalString) {
  EXPECT_EQ(Canonical("/"), "/");
  EXPECT_EQ(Canonical("users//{id}/"), "/users/{id}");
}

TEST(JoinPaths, SingleSlashAtJunction) {
  EXPECT_EQ(JoinPaths("", "id"), "/id");
  EXPECT_EQ(JoinPaths("", "/id"), "/id");
  EXPECT_EQ(JoinPaths("/user/", "/id"), "/user/id");
  EXPECT_EQ(JoinPaths("/user", "/id"), "/user/id");
  EXPECT_EQ(JoinPaths("/user/", "id"), "/user/id");
  EXPECT_EQ(JoinPaths("/user", "id"), "/user/id");
  EXPECT_EQ(JoinPaths("/user", ""), "/user/");
  EXPECT_EQ(JoinPaths("", ""), "/");
}

TEST(SplitPathSegments, IntoSmallVector) {
  SmallVector<std::string_view, 2> segments;
  SplitPathSegments("/a/b/c", segments);
  ASSERT_EQ(segments.size(), 3U);
  EXPECT_EQ(segments[2], "c");
}

TEST(SplitPathSegments, DropsEmptySegments) {
  vector<std::string_view> segments;
  SplitPathSegments("/a//b/", segments);
  ASSERT_EQ(segments.size(), 2U);
  EXPECT_EQ(segments[0], "a");
  EXPECT_EQ(segments[1], "b");

  segments.clear();
  SplitPathSegments("/", segments);
  EXPECT_TRUE(segments.empty());
}

}  // namespace junction
