#pragma once

#include <string_view>

#include "junction/http-status-code.hpp"

namespace junction::http {

// Header field names in their canonical form for emission. Lookups in HeaderMap are case-insensitive.
inline constexpr std::string_view Allow = "Allow";
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view Location = "Location";

// Reason phrases
inline constexpr std::string_view ReasonOK = "OK";
inline constexpr std::string_view ReasonCreated = "Created";
inline constexpr std::string_view ReasonAccepted = "Accepted";
inline constexpr std::string_view ReasonNoContent = "No Content";
inline constexpr std::string_view ReasonMovedPermanently = "Moved Permanently";
inline constexpr std::string_view ReasonFound = "Found";
inline constexpr std::string_view ReasonNotModified = "Not Modified";
inline constexpr std::string_view ReasonBadRequest = "Bad Request";
inline constexpr std::string_view ReasonUnauthorized = "Unauthorized";
inline constexpr std::string_view ReasonForbidden = "Forbidden";
inline constexpr std::string_view ReasonNotFound = "Not Found";
inline constexpr std::string_view ReasonMethodNotAllowed = "Method Not Allowed";
inline constexpr std::string_view ReasonConflict = "Conflict";
inline constexpr std::string_view ReasonUnprocessableEntity = "Unprocessable Entity";
inline constexpr std::string_view ReasonTooManyRequests = "Too Many Requests";
inline constexpr std::string_view ReasonInternalServerError = "Internal Server Error";
inline constexpr std::string_view ReasonNotImplemented = "Not Implemented";
inline constexpr std::string_view ReasonBadGateway = "Bad Gateway";
inline constexpr std::string_view ReasonServiceUnavailable = "Service Unavailable";
inline constexpr std::string_view ReasonGatewayTimeout = "Gateway Timeout";

// Content type
inline constexpr std::string_view ContentTypeTextPlain = "text/plain";
inline constexpr std::string_view ContentTypeTextHtml = "text/html";
inline constexpr std::string_view ContentTypeApplicationJson = "application/json";
inline constexpr std::string_view ContentTypeApplicationOctetStream = "application/octet-stream";

// Return the canonical reason phrase for the status codes we know, empty otherwise.
constexpr std::string_view ReasonPhraseFor(http::StatusCode status) noexcept {
  switch (status) {
    case StatusCodeOK:
      return ReasonOK;
    case StatusCodeCreated:
      return ReasonCreated;
    case StatusCodeAccepted:
      return ReasonAccepted;
    case StatusCodeNoContent:
      return ReasonNoContent;
    case StatusCodeMovedPermanently:
      return ReasonMovedPermanently;
    case StatusCodeFound:
      return ReasonFound;
    case StatusCodeNotModified:
      return ReasonNotModified;
    case StatusCodeBadRequest:
      return ReasonBadRequest;
    case StatusCodeUnauthorized:
      return ReasonUnauthorized;
    case StatusCodeForbidden:
      return ReasonForbidden;
    case StatusCodeNotFound:
      return ReasonNotFound;
    case StatusCodeMethodNotAllowed:
      return ReasonMethodNotAllowed;
    case StatusCodeConflict:
      return ReasonConflict;
    case StatusCodeUnprocessableEntity:
      return ReasonUnprocessableEntity;
    case StatusCodeTooManyRequests:
      return ReasonTooManyRequests;
    case StatusCodeInternalServerError:
      return ReasonInternalServerError;
    case StatusCodeNotImplemented:
      return ReasonNotImplemented;
    case StatusCodeBadGateway:
      return ReasonBadGateway;
    case StatusCodeServiceUnavailable:
      return ReasonServiceUnavailable;
    case StatusCodeGatewayTimeout:
      return ReasonGatewayTimeout;
    default:
      return {};
  }
}

}  // namespace junction::http
