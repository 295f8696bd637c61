/**
 * @file test_angle_utils.cpp
 * @brief Unit-тесты для функций работы с углами
 * @author Yan Bubenok <yan@bubenok.com>
 */

#include <doctest/doctest.h>
#include "core/angle_utils.hpp"
#include "model/validation.hpp"

using namespace coreorient::core;
using namespace coreorient::model;

TEST_CASE("dipDirectionFromStrike") {
    CHECK(dipDirectionFromStrike(Degrees{0.0}).value == doctest::Approx(90.0));
    CHECK(dipDirectionFromStrike(Degrees{16.0}).value == doctest::Approx(106.0));
    CHECK(dipDirectionFromStrike(Degrees{270.0}).value == doctest::Approx(0.0));
    CHECK(dipDirectionFromStrike(Degrees{300.0}).value == doctest::Approx(30.0));
    CHECK(dipDirectionFromStrike(Degrees{360.0}).value == doctest::Approx(90.0));
}

TEST_CASE("trendFromStrike и strikeFromTrend") {
    SUBCASE("Простирание 90 даёт азимут полюса 0") {
        CHECK(trendFromStrike(Degrees{90.0}).value == doctest::Approx(0.0));
    }

    SUBCASE("Значения") {
        CHECK(trendFromStrike(Degrees{0.0}).value == doctest::Approx(270.0));
        CHECK(trendFromStrike(Degrees{16.0}).value == doctest::Approx(286.0));
        CHECK(strikeFromTrend(Degrees{286.0}).value == doctest::Approx(16.0));
        CHECK(strikeFromTrend(Degrees{270.0}).value == doctest::Approx(0.0));
    }

    SUBCASE("Обратимость на [0, 360)") {
        for (double s = 0.0; s < 360.0; s += 7.5) {
            CHECK(strikeFromTrend(trendFromStrike(Degrees{s})).value == doctest::Approx(s));
        }
    }
}

TEST_CASE("plungeFromDip и dipFromPlunge") {
    CHECK(plungeFromDip(Degrees{0.0}).value == doctest::Approx(90.0));
    CHECK(plungeFromDip(Degrees{54.0}).value == doctest::Approx(36.0));
    CHECK(dipFromPlunge(Degrees{90.0}).value == doctest::Approx(0.0));

    for (double d = 0.0; d <= 90.0; d += 5.0) {
        CHECK(dipFromPlunge(plungeFromDip(Degrees{d})).value == doctest::Approx(d));
    }
}

TEST_CASE("Углы вне диапазона отклоняются") {
    CHECK_THROWS_AS(dipDirectionFromStrike(Degrees{-1.0}), OutOfRangeError);
    CHECK_THROWS_AS(trendFromStrike(Degrees{360.5}), OutOfRangeError);
    CHECK_THROWS_AS(strikeFromTrend(Degrees{-0.001}), OutOfRangeError);
    CHECK_THROWS_AS(plungeFromDip(Degrees{90.5}), OutOfRangeError);
    CHECK_THROWS_AS(dipFromPlunge(Degrees{-1.0}), OutOfRangeError);
}

TEST_CASE("clockwiseFromInput") {
    SUBCASE("Сумма, равная максимуму, переходит в 0") {
        CHECK(clockwiseFromInput(Degrees{180.0}, Degrees{180.0}).value == doctest::Approx(0.0));
    }

    SUBCASE("Свои границы") {
        CHECK(clockwiseFromInput(Degrees{10.0}, Degrees{15.0}, 0.0, 20.0).value == doctest::Approx(5.0));
        CHECK_THROWS_AS(clockwiseFromInput(Degrees{25.0}, Degrees{1.0}, 0.0, 20.0), OutOfRangeError);
    }
}
