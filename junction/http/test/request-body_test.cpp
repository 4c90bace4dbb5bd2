#include "junction/request-body.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "junction/vector.hpp"

namespace junction {

namespace {

RequestBody::ChunkSource MakeSource(vector<std::string> chunks) {
  return [chunks = std::move(chunks), pos = std::size_t{0}]() mutable -> std::optional<std::string> {
    if (pos == chunks.size()) {
      return std::nullopt;
    }
    return chunks[pos++];
  };
}

}  // namespace

TEST(RequestBody, TextOfBufferedBody) {
  RequestBody body(std::string("hello"));
  EXPECT_FALSE(body.consumed());
  auto awaitable = body.text();
  EXPECT_TRUE(awaitable.await_ready());
  EXPECT_EQ(awaitable.await_resume(), "hello");
  EXPECT_TRUE(body.consumed());
}

TEST(RequestBody, TextOfStreamedBodyConcatenatesChunks) {
  vector<std::string> chunks;
  chunks.emplace_back("ab");
  chunks.emplace_back("cd");
  chunks.emplace_back("e");
  RequestBody body(MakeSource(std::move(chunks)));
  EXPECT_EQ(body.text().await_resume(), "abcde");
}

TEST(RequestBody, SecondConsumerIsAProgrammingError) {
  RequestBody body(std::string("x"));
  EXPECT_EQ(body.text().await_resume(), "x");
  EXPECT_THROW((void)body.text(), std::logic_error);
  EXPECT_THROW((void)body.readChunk(), std::logic_error);
}

TEST(RequestBody, ChunksThenTextIsAProgrammingError) {
  RequestBody body(std::string("x"));
  EXPECT_EQ(body.readChunk().await_resume(), "x");
  EXPECT_THROW((void)body.text(), std::logic_error);
}

TEST(RequestBody, ReadChunksUntilEnd) {
  vector<std::string> chunks;
  chunks.emplace_back("one");
  chunks.emplace_back("two");
  RequestBody body(MakeSource(std::move(chunks)));
  EXPECT_EQ(body.readChunk().await_resume(), "one");
  EXPECT_EQ(body.readChunk().await_resume(), "two");
  EXPECT_EQ(body.readChunk().await_resume(), std::nullopt);
  EXPECT_EQ(body.readChunk().await_resume(), std::nullopt);
}

TEST(RequestBody, EmptyBody) {
  RequestBody body;
  EXPECT_EQ(body.readChunk().await_resume(), std::nullopt);
  RequestBody other;
  EXPECT_EQ(other.text().await_resume(), "");
}

}  // namespace junction
