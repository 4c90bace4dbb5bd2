#pragma once

#include <amc/smallvector.hpp>
#include <cstddef>

namespace junction {

// Vector keeping up to N elements inline, spilling to the heap beyond.
template <class T, std::size_t N>
using SmallVector = amc::SmallVector<T, N>;

}  // namespace junction
