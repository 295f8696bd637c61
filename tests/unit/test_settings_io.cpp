/**
 * @file test_settings_io.cpp
 * @brief Unit-тесты чтения настроек
 */

#include <doctest/doctest.h>
#include "io/settings_io.hpp"
#include <filesystem>
#include <fstream>

using namespace coreorient::io;
using namespace coreorient::model;

TEST_CASE("settingsFromJson") {
    SUBCASE("Пустой объект даёт значения по умолчанию") {
        auto s = settingsFromJson("{}");
        CHECK(s.reference_line == ReferenceLine::Top);
        CHECK(s.csv_delimiter == ',');
        CHECK(s.csv_decimal_separator == '.');
        CHECK(s.csv_decimal_places == 2);
        CHECK_FALSE(s.csv_include_depth);
    }

    SUBCASE("Все ключи") {
        auto s = settingsFromJson(R"({
            "reference_line": "Bottom",
            "csv": {"delimiter": ";", "decimal_separator": ",",
                    "decimal_places": 3, "include_depth": true}
        })");
        CHECK(s.reference_line == ReferenceLine::Bottom);
        CHECK(s.csv_delimiter == ';');
        CHECK(s.csv_decimal_separator == ',');
        CHECK(s.csv_decimal_places == 3);
        CHECK(s.csv_include_depth);
    }

    SUBCASE("Табуляция") {
        auto s = settingsFromJson(R"({"csv": {"delimiter": "tab"}})");
        CHECK(s.csv_delimiter == '\t');
    }
}

TEST_CASE("Ошибки настроек") {
    CHECK_THROWS_AS(settingsFromJson("{not json"), SettingsError);
    CHECK_THROWS_AS(settingsFromJson("[1, 2]"), SettingsError);
    CHECK_THROWS_AS(settingsFromJson(R"({"reference_line": "side"})"), SettingsError);
    CHECK_THROWS_AS(settingsFromJson(R"({"reference_line": 1})"), SettingsError);
    CHECK_THROWS_AS(settingsFromJson(R"({"csv": {"delimiter": ";;"}})"), SettingsError);
    CHECK_THROWS_AS(settingsFromJson(R"({"csv": {"decimal_places": -1}})"), SettingsError);
    CHECK_THROWS_AS(settingsFromJson(R"({"csv": {"decimal_places": "two"}})"), SettingsError);
    CHECK_THROWS_AS(settingsFromJson(R"({"csv": {"decimal_separator": ","}})"), SettingsError);
    CHECK_THROWS_AS(loadSettings(std::filesystem::temp_directory_path() / "coreorient_missing.json"),
                    SettingsError);
}

TEST_CASE("Сохранение и загрузка настроек") {
    auto path = std::filesystem::temp_directory_path() / "coreorient_settings_test.json";

    OrientationSettings settings;
    settings.reference_line = ReferenceLine::Bottom;
    settings.csv_delimiter = '\t';
    settings.csv_decimal_places = 5;

    saveSettings(settings, path);
    auto loaded = loadSettings(path);

    CHECK(loaded.reference_line == ReferenceLine::Bottom);
    CHECK(loaded.csv_delimiter == '\t');
    CHECK(loaded.csv_decimal_places == 5);
    CHECK_FALSE(loaded.csv_include_depth);

    std::filesystem::remove(path);
}
