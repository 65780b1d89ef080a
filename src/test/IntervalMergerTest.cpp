#include <cassert>
#include <iostream>
#include <utility>
#include <vector>

#include "domain/IntervalMerger.hpp"

using odsmanager::domain::MergeIntervals;
using Spans = std::vector<std::pair<int, int>>;

int main() {
    std::cout << "[Test] Starting IntervalMerger Test..." << std::endl;

    assert((MergeIntervals(Spans{{1, 3}, {2, 5}, {7, 9}}) == Spans{{1, 5}, {7, 9}}));
    assert(MergeIntervals(Spans{}).empty());
    assert((MergeIntervals(Spans{{1, 2}, {3, 4}}) == Spans{{1, 2}, {3, 4}}));

    // Touching spans share a point and merge.
    assert((MergeIntervals(Spans{{1, 2}, {2, 4}}) == Spans{{1, 4}}));

    // Input order does not matter; contained spans vanish.
    assert((MergeIntervals(Spans{{7, 9}, {1, 10}, {2, 3}}) == Spans{{1, 10}}));
    assert((MergeIntervals(Spans{{6, 8}, {1, 3}}) == Spans{{1, 3}, {6, 8}}));

    // A single degenerate span survives as is.
    assert((MergeIntervals(Spans{{4, 4}}) == Spans{{4, 4}}));

    std::cout << "[PASS] IntervalMerger Test." << std::endl;
    return 0;
}
