#pragma once

#include "indicators/base.h"
#include <vector>

namespace ds {

/// Indices i with left <= i < size - right whose value is strictly below
/// each of the `left` preceding and `right` following values.
///
/// Ties never qualify. A nullopt or non-finite value anywhere in the window
/// [i - left, i + right] disqualifies i. Result is ascending.
/// Throws std::invalid_argument if left or right is negative.
std::vector<int> find_pivot_lows(const Series& series, int left, int right);

} // namespace ds
