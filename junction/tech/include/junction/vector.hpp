#pragma once

#include <amc/vector.hpp>

namespace junction {

template <class T>
using vector = amc::vector<T>;

}  // namespace junction
