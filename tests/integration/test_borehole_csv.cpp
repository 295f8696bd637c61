/**
 * @file test_borehole_csv.cpp
 * @brief Интеграционный тест: CSV станций и замеров -> плоскости -> CSV
 */

#include <doctest/doctest.h>
#include "core/borehole.hpp"
#include "io/csv_reader.hpp"
#include "io/csv_writer.hpp"
#include "io/file_utils.hpp"
#include <cmath>
#include <filesystem>
#include <sstream>

using namespace coreorient::io;
using namespace coreorient::model;

namespace {

std::filesystem::path fixturePath(const std::string& name) {
    return std::filesystem::path(COREORIENT_SOURCE_DIR) / "tests" / "fixtures" / name;
}

} // namespace

TEST_CASE("Скважина из fixtures: survey.csv + measurements.csv") {
    auto stations = readSurveyStations(fixturePath("survey.csv"));
    auto measurements = readRawMeasurements(fixturePath("measurements.csv"));
    REQUIRE(stations.size() == 5);
    REQUIRE(measurements.size() == 5);

    coreorient::core::Borehole borehole(ReferenceLine::Top, measurements, stations);
    const auto& planes = borehole.orientedMeasurements();
    const auto& assignments = borehole.stationAssignments();
    REQUIRE(planes.size() == 5);

    const std::vector<size_t> expected_stations = {0, 1, 2, 3, 4};
    CHECK(assignments == expected_stations);

    CHECK(std::round(planes[0].strike().value) == 16.0);
    CHECK(std::round(planes[0].dip().value) == 54.0);
    CHECK(std::round(planes[0].pole().trend.value) == 286.0);
    CHECK(planes[3].strike().value == doctest::Approx(318.4365).epsilon(1e-5));
    CHECK(planes[3].dip().value == doctest::Approx(89.4091).epsilon(1e-5));

    for (const auto& plane : planes) {
        CHECK(plane.strike().value >= 0.0);
        CHECK(plane.strike().value <= 360.0);
        CHECK(plane.pole().plunge.value == doctest::Approx(90.0 - plane.dip().value));
    }

    SUBCASE("Экспорт с глубиной") {
        std::vector<Meters> depths;
        for (const auto& m : measurements) {
            depths.push_back(m.depth);
        }

        CsvExportOptions options;
        options.include_depth = true;
        auto path = std::filesystem::temp_directory_path() / "coreorient_borehole_planes.csv";
        writeCsvPlanes(planes, path, options, depths);

        std::istringstream written(readTextFile(path));
        std::string line;
        std::vector<std::string> lines;
        while (std::getline(written, line)) {
            lines.push_back(line);
        }
        REQUIRE(lines.size() == 6);
        CHECK(lines[0] == "depth,strike,dip,dip_direction,trend,plunge");
        CHECK(lines[1] == "1.00,16.35,53.81,106.35,286.35,36.19");
        CHECK(lines[4] == "19.00,318.44,89.41,48.44,228.44,0.59");

        std::filesystem::remove(path);
    }
}

TEST_CASE("Скважина из fixtures: ошибки данных") {
    SUBCASE("Первая станция не на устье") {
        auto stations = readSurveyStations(fixturePath("survey_bad_collar.csv"));
        auto measurements = readRawMeasurements(fixturePath("measurements.csv"));
        CHECK_THROWS_AS(
            coreorient::core::Borehole(ReferenceLine::Top, measurements, stations),
            coreorient::core::InvalidSurveyDataError);
    }

    SUBCASE("Замер глубже последней станции") {
        auto stations = readSurveyStations(fixturePath("survey.csv"));
        auto measurements = readRawMeasurements(fixturePath("measurements_out_of_range.csv"));
        CHECK_THROWS_AS(
            coreorient::core::Borehole(ReferenceLine::Top, measurements, stations),
            coreorient::core::DepthOutOfSurveyRangeError);
    }
}
