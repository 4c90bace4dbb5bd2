#pragma once

#include <coroutine>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace junction {

// Single-consumer handle on a request body, either fully buffered or pulled chunk by chunk from the transport.
//
// The body can be taken exactly once: either as a whole with text(), or as a stream of chunks with readChunk()
// (repeated calls continue the same stream). Mixing both, or calling text() twice, is a programming error and
// throws std::logic_error.
//
// Awaitables currently complete synchronously, the transport hands over a ChunkSource that has the bytes (or
// blocks on them). They still go through co_await so that a truly suspending source can be plugged later
// without changing endpoint code.
class RequestBody {
 public:
  // Returns the next chunk of the body, or std::nullopt once the stream is exhausted.
  using ChunkSource = std::function<std::optional<std::string>()>;

  class TextAwaitable {
   public:
    explicit TextAwaitable(RequestBody& body) noexcept : _body(body) {}

    [[nodiscard]] bool await_ready() const noexcept { return true; }
    void await_suspend([[maybe_unused]] std::coroutine_handle<> coroutine) const noexcept {}
    [[nodiscard]] std::string await_resume() { return _body.drainAll(); }

   private:
    RequestBody& _body;
  };

  class ChunkAwaitable {
   public:
    explicit ChunkAwaitable(RequestBody& body) noexcept : _body(body) {}

    [[nodiscard]] bool await_ready() const noexcept { return true; }
    void await_suspend([[maybe_unused]] std::coroutine_handle<> coroutine) const noexcept {}
    [[nodiscard]] std::optional<std::string> await_resume() { return _body.nextChunk(); }

   private:
    RequestBody& _body;
  };

  // Empty body.
  RequestBody() noexcept = default;

  // Fully buffered body.
  explicit RequestBody(std::string buffered);

  // Streamed body. An empty source behaves as an empty body.
  explicit RequestBody(ChunkSource source);

  RequestBody(const RequestBody&) = delete;
  RequestBody& operator=(const RequestBody&) = delete;

  RequestBody(RequestBody&&) noexcept = default;
  RequestBody& operator=(RequestBody&&) noexcept = default;

  ~RequestBody() = default;

  // Takes the whole body. Throws std::logic_error if the body was already taken.
  [[nodiscard]] TextAwaitable text();

  // Takes the next chunk of the body. Throws std::logic_error if the body was taken with text().
  [[nodiscard]] ChunkAwaitable readChunk();

  // Tells whether a consumer already started reading this body.
  [[nodiscard]] bool consumed() const noexcept { return _state != State::Unread; }

 private:
  enum class State : std::uint8_t { Unread, Streaming, Taken };

  std::string drainAll();
  std::optional<std::string> nextChunk();

  std::string _buffered;
  ChunkSource _source;
  State _state{State::Unread};
  bool _bufferedDelivered{false};
};

}  // namespace junction
