#include "junction/http-request.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace junction {

HttpRequest::HttpRequest(http::Method method, std::string target, http::HeaderMap headers, RequestBody body)
    : _methodToken(http::MethodToStr(method)),
      _target(std::move(target)),
      _headers(std::move(headers)),
      _body(std::move(body)),
      _method(method) {
  splitTarget();
}

HttpRequest::HttpRequest(std::string methodToken, std::string target, http::HeaderMap headers, RequestBody body)
    : _methodToken(std::move(methodToken)),
      _target(std::move(target)),
      _headers(std::move(headers)),
      _body(std::move(body)),
      _method(http::MethodStrToOptEnum(_methodToken)) {
  splitTarget();
}

void HttpRequest::splitTarget() {
  const std::string_view targetView(_target);
  const auto queryPos = targetView.find('?');
  if (queryPos == std::string_view::npos) {
    _path = targetView;
  } else {
    _path = targetView.substr(0, queryPos);
    _query = targetView.substr(queryPos + 1);
  }
}

std::optional<std::string_view> HttpRequest::param(std::string_view name) const noexcept {
  const auto it = std::ranges::find_if(_params, [name](const PathParamCapture& capture) { return capture.key == name; });
  if (it == _params.end()) {
    return std::nullopt;
  }
  return it->value;
}

std::optional<std::string_view> HttpRequest::paramAt(std::size_t pos) const noexcept {
  if (pos >= _params.size()) {
    return std::nullopt;
  }
  return _params[pos].value;
}

}  // namespace junction
