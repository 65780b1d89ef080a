/**
 * @file IntervalMerger.hpp
 * @brief Merges (start, end) pairs into maximal non-overlapping spans.
 */

#pragma once

#include <algorithm>
#include <utility>
#include <vector>

namespace odsmanager::domain {

/**
 * @brief Merges overlapping intervals.
 *
 * Pairs are assumed to satisfy start <= end. A pair whose start equals the running end is
 * merged; disjoint pairs stay separate. Empty input gives empty output. O(n log n).
 */
template <typename T>
std::vector<std::pair<T, T>> MergeIntervals(std::vector<std::pair<T, T>> intervals) {
    std::vector<std::pair<T, T>> merged;
    if (intervals.empty()) return merged;

    std::stable_sort(intervals.begin(), intervals.end(),
                     [](const std::pair<T, T>& a, const std::pair<T, T>& b) { return a.first < b.first; });

    T currentStart = intervals.front().first;
    T currentEnd = intervals.front().second;
    for (std::size_t i = 1; i < intervals.size(); ++i) {
        const auto& next = intervals[i];
        if (!(currentEnd < next.first)) {
            currentEnd = std::max(currentEnd, next.second);
        } else {
            merged.emplace_back(currentStart, currentEnd);
            currentStart = next.first;
            currentEnd = next.second;
        }
    }
    merged.emplace_back(currentStart, currentEnd);
    return merged;
}

} // namespace odsmanager::domain
