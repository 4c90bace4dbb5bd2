#pragma once

#include <string_view>

namespace junction {

struct PathParamCapture {
  std::string_view key;
  std::string_view value;
};

}  // namespace junction
