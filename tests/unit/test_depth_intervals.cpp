/**
 * @file test_depth_intervals.cpp
 * @brief Unit-тесты привязки глубин к станциям
 */

#include <doctest/doctest.h>
#include "core/depth_intervals.hpp"

using namespace coreorient::core;
using namespace coreorient::model;

namespace {

SurveyStationList makeStations(std::initializer_list<double> depths) {
    SurveyStationList stations;
    for (double d : depths) {
        stations.emplace_back(Meters{d}, Degrees{0.0}, Degrees{-90.0});
    }
    return stations;
}

std::optional<size_t> classify(const DepthIntervalList& intervals, double depth) {
    return findStationIndex(intervals, Meters{depth});
}

} // namespace

TEST_CASE("buildDepthIntervals") {
    auto intervals = buildDepthIntervals(makeStations({0.0, 12.5, 16.0, 22.0, 30.0}));
    REQUIRE(intervals.size() == 5);

    SUBCASE("Границы по середине между станциями") {
        CHECK(intervals[0].low.value == doctest::Approx(0.0));
        CHECK(intervals[0].high.value == doctest::Approx(6.25));
        CHECK(intervals[1].low.value == doctest::Approx(6.25));
        CHECK(intervals[1].high.value == doctest::Approx(14.25));
        CHECK(intervals[2].high.value == doctest::Approx(19.0));
        CHECK(intervals[3].high.value == doctest::Approx(26.0));
        CHECK(intervals[4].low.value == doctest::Approx(26.0));
        CHECK(intervals[4].high.value == doctest::Approx(30.0));
    }

    SUBCASE("Интервалы идут подряд без разрывов") {
        for (size_t i = 1; i < intervals.size(); ++i) {
            CHECK(intervals[i].low.value == intervals[i - 1].high.value);
        }
    }

    SUBCASE("Замкнут только последний интервал") {
        for (size_t i = 0; i + 1 < intervals.size(); ++i) {
            CHECK_FALSE(intervals[i].includes_high);
        }
        CHECK(intervals.back().includes_high);
    }
}

TEST_CASE("findStationIndex") {
    auto intervals = buildDepthIntervals(makeStations({0.0, 12.5, 16.0, 22.0, 30.0}));

    SUBCASE("Глубина станции относится к этой станции") {
        CHECK(classify(intervals, 0.0) == 0u);
        CHECK(classify(intervals, 12.5) == 1u);
        CHECK(classify(intervals, 16.0) == 2u);
        CHECK(classify(intervals, 22.0) == 3u);
        CHECK(classify(intervals, 30.0) == 4u);
    }

    SUBCASE("Ближайшая станция") {
        CHECK(classify(intervals, 1.0) == 0u);
        CHECK(classify(intervals, 10.0) == 1u);
        CHECK(classify(intervals, 17.0) == 2u);
        CHECK(classify(intervals, 27.0) == 4u);
    }

    SUBCASE("Середина относится к более глубокой станции") {
        CHECK(classify(intervals, 6.25) == 1u);
        CHECK(classify(intervals, 14.25) == 2u);
        CHECK(classify(intervals, 19.0) == 3u);
        CHECK(classify(intervals, 26.0) == 4u);
    }

    SUBCASE("Вне интервалов") {
        CHECK_FALSE(classify(intervals, 31.0).has_value());
        CHECK_FALSE(classify(intervals, 30.0001).has_value());
        CHECK_FALSE(classify(intervals, -0.5).has_value());
    }
}

TEST_CASE("Одна станция покрывает только свою глубину") {
    auto intervals = buildDepthIntervals(makeStations({0.0}));
    REQUIRE(intervals.size() == 1);
    CHECK(classify(intervals, 0.0) == 0u);
    CHECK_FALSE(classify(intervals, 0.1).has_value());
}

TEST_CASE("Пустой список станций") {
    auto intervals = buildDepthIntervals({});
    CHECK(intervals.empty());
    CHECK_FALSE(classify(intervals, 0.0).has_value());
}

TEST_CASE("DepthInterval::compare") {
    DepthInterval interval{Meters{5.0}, Meters{10.0}, false};
    CHECK(interval.compare(Meters{4.9}) < 0);
    CHECK(interval.compare(Meters{5.0}) == 0);
    CHECK(interval.compare(Meters{9.99}) == 0);
    CHECK(interval.compare(Meters{10.0}) > 0);
    CHECK_FALSE(interval.contains(Meters{10.0}));

    interval.includes_high = true;
    CHECK(interval.contains(Meters{10.0}));
}
