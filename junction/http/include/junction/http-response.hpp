#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "junction/http-constants.hpp"
#include "junction/http-header.hpp"
#include "junction/http-status-code.hpp"

namespace junction {

// Response value produced by endpoints and handed back to the transport for serialization.
//
// The body is one of: empty, buffered bytes, or a lazy producer called by the consumer until it returns
// std::nullopt. Setters come in lvalue and rvalue flavors so that a response can be built fluently:
//   co_return HttpResponse(http::StatusCodeCreated).header("Location", "/users/42").body("created");
class HttpResponse {
 public:
  // Produces the next chunk of a lazy body, std::nullopt when done.
  using BodyProducer = std::function<std::optional<std::string>()>;

  enum class BodyKind : std::uint8_t { Empty, Buffered, Lazy };

  // Constructs an empty 200 response.
  HttpResponse() noexcept = default;

  // Constructs a response with given status code and reason (the standard reason phrase if empty).
  explicit HttpResponse(http::StatusCode code, std::string_view reason = {});

  // Constructs a 200 response with given buffered body and content type.
  explicit HttpResponse(std::string_view body, std::string_view contentType = http::ContentTypeTextPlain);

  [[nodiscard]] http::StatusCode status() const noexcept { return _status; }

  // The explicitly set reason, or the standard reason phrase of the status code.
  [[nodiscard]] std::string_view reason() const noexcept {
    return _reason.empty() ? http::ReasonPhraseFor(_status) : std::string_view(_reason);
  }

  [[nodiscard]] const http::HeaderMap& headers() const noexcept { return _headers; }

  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept {
    return _headers.get(name);
  }

  [[nodiscard]] BodyKind bodyKind() const noexcept { return static_cast<BodyKind>(_body.index()); }

  // The buffered body, empty for empty and lazy bodies.
  [[nodiscard]] std::string_view bodyInMemory() const noexcept {
    const auto* pBuffered = std::get_if<std::string>(&_body);
    return pBuffered == nullptr ? std::string_view{} : std::string_view(*pBuffered);
  }

  HttpResponse& status(http::StatusCode statusCode) & noexcept {
    _status = statusCode;
    return *this;
  }

  HttpResponse&& status(http::StatusCode statusCode) && noexcept {
    _status = statusCode;
    return std::move(*this);
  }

  HttpResponse& reason(std::string_view reason) & {
    _reason.assign(reason);
    return *this;
  }

  HttpResponse&& reason(std::string_view reason) && {
    _reason.assign(reason);
    return std::move(*this);
  }

  // Sets a header, replacing any existing one with the same name (case-insensitive).
  HttpResponse& header(std::string_view key, std::string_view value) & {
    _headers.set(key, value);
    return *this;
  }

  HttpResponse&& header(std::string_view key, std::string_view value) && {
    _headers.set(key, value);
    return std::move(*this);
  }

  // Appends a header, keeping existing ones with the same name.
  HttpResponse& addHeader(std::string_view key, std::string_view value) & {
    _headers.add(key, value);
    return *this;
  }

  HttpResponse&& addHeader(std::string_view key, std::string_view value) && {
    _headers.add(key, value);
    return std::move(*this);
  }

  // Sets a buffered body and its content type. An empty body removes the Content-Type header.
  HttpResponse& body(std::string body, std::string_view contentType = http::ContentTypeTextPlain) & {
    setBody(std::move(body), contentType);
    return *this;
  }

  HttpResponse&& body(std::string body, std::string_view contentType = http::ContentTypeTextPlain) && {
    setBody(std::move(body), contentType);
    return std::move(*this);
  }

  HttpResponse& body(std::string_view body, std::string_view contentType = http::ContentTypeTextPlain) & {
    setBody(std::string(body), contentType);
    return *this;
  }

  HttpResponse&& body(std::string_view body, std::string_view contentType = http::ContentTypeTextPlain) && {
    setBody(std::string(body), contentType);
    return std::move(*this);
  }

  HttpResponse& body(const char* body, std::string_view contentType = http::ContentTypeTextPlain) & {
    setBody(std::string(body), contentType);
    return *this;
  }

  HttpResponse&& body(const char* body, std::string_view contentType = http::ContentTypeTextPlain) && {
    setBody(std::string(body), contentType);
    return std::move(*this);
  }

  // Sets a lazy body. Throws std::invalid_argument if producer is empty.
  HttpResponse& bodyProducer(BodyProducer producer,
                             std::string_view contentType = http::ContentTypeApplicationOctetStream) & {
    setBodyProducer(std::move(producer), contentType);
    return *this;
  }

  HttpResponse&& bodyProducer(BodyProducer producer,
                              std::string_view contentType = http::ContentTypeApplicationOctetStream) && {
    setBodyProducer(std::move(producer), contentType);
    return std::move(*this);
  }

  // Removes the body, whatever its kind, and its Content-Type header.
  void clearBody() noexcept;

  // Takes the full body, running the lazy producer to completion if any. The response body is empty afterwards.
  [[nodiscard]] std::string takeBody();

  // Takes the next chunk of the body. Buffered bodies are returned as a single chunk.
  // Returns std::nullopt when the body is exhausted.
  [[nodiscard]] std::optional<std::string> nextBodyChunk();

 private:
  void setBody(std::string body, std::string_view contentType);
  void setBodyProducer(BodyProducer producer, std::string_view contentType);

  http::StatusCode _status{http::StatusCodeOK};
  std::string _reason;
  http::HeaderMap _headers;
  std::variant<std::monostate, std::string, BodyProducer> _body;
};

}  // namespace junction
