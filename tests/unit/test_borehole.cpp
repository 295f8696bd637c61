/**
 * @file test_borehole.cpp
 * @brief Unit-тесты скважины: привязка замеров и пересчёт
 */

#include <doctest/doctest.h>
#include "core/borehole.hpp"
#include "core/orient.hpp"
#include <cmath>

using namespace coreorient::core;
using namespace coreorient::model;

namespace {

SurveyStationList sampleStations() {
    return {
        {Meters{0.0}, Degrees{262.7}, Degrees{-55.3}},
        {Meters{12.5}, Degrees{0.0}, Degrees{-45.0}},
        {Meters{16.0}, Degrees{45.0}, Degrees{-60.0}},
        {Meters{22.0}, Degrees{90.0}, Degrees{-30.0}},
        {Meters{30.0}, Degrees{180.0}, Degrees{-45.0}}
    };
}

} // namespace

TEST_CASE("Borehole: привязка и пересчёт замеров") {
    RawMeasurementList measurements = {
        {Meters{16.0}, Degrees{30.0}, Degrees{90.0}},
        {Meters{10.0}, Degrees{90.0}, Degrees{180.0}},
        {Meters{1.0}, Degrees{65.0}, Degrees{230.0}},
        {Meters{30.0}, Degrees{90.0}, Degrees{0.0}}
    };

    Borehole borehole(ReferenceLine::Top, measurements, sampleStations());

    const auto& planes = borehole.orientedMeasurements();
    const auto& assignments = borehole.stationAssignments();
    REQUIRE(planes.size() == measurements.size());
    REQUIRE(assignments.size() == measurements.size());

    SUBCASE("Станции по глубине") {
        CHECK(assignments[0] == 2);
        CHECK(assignments[1] == 1);
        CHECK(assignments[2] == 0);
        CHECK(assignments[3] == 4);
    }

    SUBCASE("Порядок замеров сохраняется") {
        CHECK(planes[0].strike().value == doctest::Approx(61.1021).epsilon(1e-5));
        CHECK(std::round(planes[1].strike().value) == 90.0);
        CHECK(std::round(planes[1].pole().trend.value) == 0.0);
        CHECK(std::round(planes[2].strike().value) == 16.0);
        CHECK(std::round(planes[2].dip().value) == 54.0);
        CHECK(std::round(planes[3].strike().value) == 270.0);
        CHECK(std::round(planes[3].pole().trend.value) == 180.0);
    }

    SUBCASE("Совпадает с пересчётом одного замера") {
        const auto& st = borehole.stations()[assignments[0]];
        auto expected = Orient(st.bearing, st.inclination, Degrees{30.0}, Degrees{90.0}).toPlane();
        CHECK(planes[0].dip().value == doctest::Approx(expected.dip().value));
        CHECK(planes[0].pole().plunge.value == doctest::Approx(expected.pole().plunge.value));
    }

    CHECK(borehole.referenceLine() == ReferenceLine::Top);
    CHECK(borehole.stations().size() == 5);
}

TEST_CASE("Borehole: положение ориентирной линии применяется ко всем замерам") {
    RawMeasurementList bottom_measurements = {{Meters{1.0}, Degrees{65.0}, Degrees{50.0}}};
    RawMeasurementList top_measurements = {{Meters{1.0}, Degrees{65.0}, Degrees{230.0}}};

    Borehole bottom(ReferenceLine::Bottom, bottom_measurements, sampleStations());
    Borehole top(ReferenceLine::Top, top_measurements, sampleStations());

    CHECK(bottom.orientedMeasurements()[0].strike().value ==
          doctest::Approx(top.orientedMeasurements()[0].strike().value));
    CHECK(bottom.orientedMeasurements()[0].dip().value ==
          doctest::Approx(top.orientedMeasurements()[0].dip().value));
}

TEST_CASE("Borehole: некорректные станции") {
    RawMeasurementList measurements = {{Meters{1.0}, Degrees{45.0}, Degrees{0.0}}};

    SUBCASE("Первая станция не на глубине 0") {
        SurveyStationList stations = {
            {Meters{5.0}, Degrees{0.0}, Degrees{-90.0}},
            {Meters{10.0}, Degrees{0.0}, Degrees{-90.0}}
        };
        CHECK_THROWS_AS(Borehole(ReferenceLine::Top, measurements, stations), InvalidSurveyDataError);
    }

    SUBCASE("Пустой список") {
        CHECK_THROWS_AS(Borehole(ReferenceLine::Top, measurements, {}), InvalidSurveyDataError);
    }

    SUBCASE("Немонотонные глубины, отчёт содержит все ошибки") {
        SurveyStationList stations = {
            {Meters{0.0}, Degrees{0.0}, Degrees{-90.0}},
            {Meters{20.0}, Degrees{0.0}, Degrees{-90.0}},
            {Meters{10.0}, Degrees{0.0}, Degrees{-90.0}},
            {Meters{10.0}, Degrees{0.0}, Degrees{-90.0}}
        };
        try {
            Borehole borehole(ReferenceLine::Top, measurements, stations);
            FAIL("ожидалось исключение");
        } catch (const InvalidSurveyDataError& e) {
            CHECK(e.report().errors.size() == 2);
        }
    }

    SUBCASE("Угол станции вне диапазона") {
        SurveyStationList stations = {
            {Meters{0.0}, Degrees{360.001}, Degrees{-90.0}},
            {Meters{10.0}, Degrees{0.0}, Degrees{-90.0}}
        };
        CHECK_THROWS_AS(Borehole(ReferenceLine::Top, measurements, stations), OutOfRangeError);
    }
}

TEST_CASE("Borehole: замер вне интервалов станций") {
    RawMeasurementList measurements = {
        {Meters{10.0}, Degrees{45.0}, Degrees{0.0}},
        {Meters{31.0}, Degrees{45.0}, Degrees{0.0}}
    };

    try {
        Borehole borehole(ReferenceLine::Top, measurements, sampleStations());
        FAIL("ожидалось исключение");
    } catch (const DepthOutOfSurveyRangeError& e) {
        CHECK(e.depth().value == doctest::Approx(31.0));
        CHECK(e.measurementIndex() == 1);
        CHECK(std::string(e.what()).find("Замер 2") != std::string::npos);
    }
}

TEST_CASE("Borehole: угол замера вне диапазона") {
    RawMeasurementList measurements = {{Meters{1.0}, Degrees{90.5}, Degrees{0.0}}};
    CHECK_THROWS_AS(Borehole(ReferenceLine::Top, measurements, sampleStations()), OutOfRangeError);
}

TEST_CASE("Borehole без замеров") {
    Borehole borehole(ReferenceLine::Top, {}, sampleStations());
    CHECK(borehole.orientedMeasurements().empty());
    CHECK(borehole.stationAssignments().empty());
}
