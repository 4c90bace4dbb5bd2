#include "junction/http-response.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "junction/http-constants.hpp"
#include "junction/http-status-code.hpp"

namespace junction {

HttpResponse::HttpResponse(http::StatusCode code, std::string_view reason) : _status(code), _reason(reason) {}

HttpResponse::HttpResponse(std::string_view body, std::string_view contentType) {
  setBody(std::string(body), contentType);
}

void HttpResponse::setBody(std::string body, std::string_view contentType) {
  if (body.empty()) {
    clearBody();
    return;
  }
  _headers.set(http::ContentType, contentType);
  _body = std::move(body);
}

void HttpResponse::setBodyProducer(BodyProducer producer, std::string_view contentType) {
  if (!producer) {
    throw std::invalid_argument("Cannot set empty BodyProducer");
  }
  _headers.set(http::ContentType, contentType);
  _body = std::move(producer);
}

void HttpResponse::clearBody() noexcept {
  _headers.erase(http::ContentType);
  _body = std::monostate{};
}

std::string HttpResponse::takeBody() {
  std::string out;
  for (auto chunk = nextBodyChunk(); chunk; chunk = nextBodyChunk()) {
    out.append(*chunk);
  }
  return out;
}

std::optional<std::string> HttpResponse::nextBodyChunk() {
  if (auto* pBuffered = std::get_if<std::string>(&_body)) {
    std::string out = std::move(*pBuffered);
    _body = std::monostate{};
    return out;
  }
  if (auto* pProducer = std::get_if<BodyProducer>(&_body)) {
    auto chunk = (*pProducer)();
    if (!chunk) {
      _body = std::monostate{};
    }
    return chunk;
  }
  return std::nullopt;
}

}  // namespace junction
