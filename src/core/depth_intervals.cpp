/**
 * @file depth_intervals.cpp
 * @brief Реализация привязки замеров к станциям
 */

#include "depth_intervals.hpp"

namespace coreorient::core {

DepthIntervalList buildDepthIntervals(const SurveyStationList& stations) {
    DepthIntervalList intervals;
    if (stations.empty()) {
        return intervals;
    }
    intervals.reserve(stations.size());

    const size_t last = stations.size() - 1;
    for (size_t i = 0; i < stations.size(); ++i) {
        const Meters depth = stations[i].depth;

        DepthInterval interval;
        interval.low = (i == 0)
            ? depth
            : midpoint(stations[i - 1].depth, depth);
        interval.high = (i == last)
            ? depth
            : midpoint(depth, stations[i + 1].depth);
        interval.includes_high = (i == last);

        intervals.push_back(interval);
    }

    return intervals;
}

std::optional<size_t> findStationIndex(
    const DepthIntervalList& intervals,
    Meters depth
) noexcept {
    size_t lo = 0;
    size_t hi = intervals.size();

    while (lo < hi) {
        size_t mid = lo + (hi - lo) / 2;
        int cmp = intervals[mid].compare(depth);
        if (cmp == 0) {
            return mid;
        }
        if (cmp < 0) {
            hi = mid;
        } else {
            lo = mid + 1;
        }
    }

    return std::nullopt;
}

} // namespace coreorient::core
