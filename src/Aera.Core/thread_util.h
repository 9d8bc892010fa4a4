#pragma once

#include <numeric>
#include <vector>

#include <oneapi/tbb/parallel_for_each.h>

namespace aera::core {

/// @brief Parallel for each over an indexed accessed containers
/// @tparam Index Iterator type
/// @tparam UnaryFunction Function type
/// @param first The first element index
/// @param last The one past the last element index
/// @param func The function object to apply
/// @return none
template <class Index, class UnaryFunction>
auto parallel_for(Index first, Index last, UnaryFunction func) {
    if (last <= first) {
        return;
    }

    auto range = std::vector<Index>(last - first);
    std::iota(range.begin(), range.end(), first);
    tbb::parallel_for_each(range.begin(), range.end(), std::move(func));
}

} // namespace aera::core
