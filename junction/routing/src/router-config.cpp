#include "junction/router-config.hpp"

namespace junction {

RouterConfig& RouterConfig::withHeadFallbackToGet(bool enable) {
  headFallbackToGet = enable;
  return *this;
}

RouterConfig& RouterConfig::withAllowHeaderOnMethodNotAllowed(bool enable) {
  allowHeaderOnMethodNotAllowed = enable;
  return *this;
}

RouterConfig& RouterConfig::withExposeErrorDetails(bool enable) {
  exposeErrorDetails = enable;
  return *this;
}

}  // namespace junction
