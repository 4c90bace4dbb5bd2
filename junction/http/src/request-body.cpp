#include "junction/request-body.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace junction {

RequestBody::RequestBody(std::string buffered) : _buffered(std::move(buffered)) {}

RequestBody::RequestBody(ChunkSource source) : _source(std::move(source)) {}

RequestBody::TextAwaitable RequestBody::text() {
  if (_state != State::Unread) {
    throw std::logic_error("Request body already consumed");
  }
  _state = State::Taken;
  return TextAwaitable(*this);
}

RequestBody::ChunkAwaitable RequestBody::readChunk() {
  if (_state == State::Taken) {
    throw std::logic_error("Request body already consumed");
  }
  _state = State::Streaming;
  return ChunkAwaitable(*this);
}

std::string RequestBody::drainAll() {
  std::string out = std::move(_buffered);
  _buffered.clear();
  _bufferedDelivered = true;
  if (_source) {
    for (auto chunk = _source(); chunk; chunk = _source()) {
      out.append(*chunk);
    }
    _source = nullptr;
  }
  return out;
}

std::optional<std::string> RequestBody::nextChunk() {
  if (!_bufferedDelivered) {
    _bufferedDelivered = true;
    if (!_buffered.empty()) {
      return std::exchange(_buffered, {});
    }
  }
  if (!_source) {
    return std::nullopt;
  }
  auto chunk = _source();
  if (!chunk) {
    _source = nullptr;
  }
  return chunk;
}

}  // namespace junction
