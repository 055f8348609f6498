// SPDX-License-Identifier: MIT
#pragma once

#include <algorithm>
#include <cstddef>
#include <span>

namespace interpfit {

/// Locate the insertion point of `value` in an ascending sequence.
///
/// Returns 0 for an empty sequence or when value <= sorted.front(), and
/// sorted.size() when value >= sorted.back(). Otherwise returns the first
/// index whose element is strictly greater than value (upper bound), so the
/// bracketing pair is [i-1, i] with sorted[i-1] <= value < sorted[i]. An exact
/// interior match sorted[k] == value yields k+1, and duplicate coordinates
/// never produce a zero-width bracket.
///
/// Sortedness is not validated.
[[nodiscard]] inline size_t
find_insertion_point(std::span<const double> sorted, double value) noexcept {
    if (sorted.empty()) return 0;
    if (value <= sorted.front()) return 0;
    if (value >= sorted.back()) return sorted.size();

    auto it = std::upper_bound(sorted.begin(), sorted.end(), value);
    return static_cast<size_t>(it - sorted.begin());
}

} // namespace interpfit
