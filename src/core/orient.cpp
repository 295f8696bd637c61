/**
 * @file orient.cpp
 * @brief Реализация пересчёта alpha/beta в ориентировку плоскости
 */

#include "orient.hpp"
#include "angle_utils.hpp"
#include "model/validation.hpp"
#include <algorithm>
#include <cmath>
#include <numbers>

namespace coreorient::core {

namespace {

constexpr double kHalfPi = std::numbers::pi / 2.0;
constexpr double kTwoPi = std::numbers::pi * 2.0;

/// Горизонтальная составляющая нормали, ниже которой азимут не определён
constexpr double kDegenerateHorizontal = 1e-12;

} // namespace

Degrees adjustBetaForReferenceLine(Degrees beta, ReferenceLine line) {
    switch (line) {
        case ReferenceLine::Top:
            return beta;
        case ReferenceLine::Bottom:
            return clockwiseFromInput(beta, Degrees{180.0},
                validation_limits::kMinAzimuth, validation_limits::kMaxAzimuth, "beta");
    }
    return beta;
}

Orient::Orient(Degrees bearing,
               Degrees inclination,
               Degrees alpha,
               Degrees beta,
               ReferenceLine line)
    : bearing_(validateRange(bearing, validation_limits::kMinAzimuth,
                             validation_limits::kMaxAzimuth, "bearing").toRadians())
    , inclination_(validateRange(inclination, validation_limits::kMinInclination,
                                 validation_limits::kMaxInclination, "inclination").toRadians())
    , alpha_(validateRange(alpha, validation_limits::kMinAcute,
                           validation_limits::kMaxAcute, "alpha").toRadians())
    , beta_(adjustBetaForReferenceLine(
          validateRange(beta, validation_limits::kMinAzimuth,
                        validation_limits::kMaxAzimuth, "beta"), line).toRadians()) {}

glm::dvec3 Orient::boreholeNormal() const noexcept {
    return glm::dvec3{
        cos(alpha_) * cos(beta_),
        cos(alpha_) * sin(beta_),
        sin(alpha_)
    };
}

glm::dmat3 Orient::inclinationRotation() const noexcept {
    const double i = kHalfPi - inclination_.value;
    const double c = std::cos(i);
    const double s = std::sin(i);

    // glm хранит матрицы по столбцам:
    // | c  0  s |
    // | 0  1  0 |
    // |-s  0  c |
    return glm::dmat3{
        glm::dvec3{c, 0.0, -s},
        glm::dvec3{0.0, 1.0, 0.0},
        glm::dvec3{s, 0.0, c}
    };
}

glm::dmat3 Orient::bearingRotation() const noexcept {
    const double b = kHalfPi - bearing_.value;
    const double c = std::cos(b);
    const double s = std::sin(b);

    // | c -s  0 |
    // | s  c  0 |
    // | 0  0  1 |
    return glm::dmat3{
        glm::dvec3{c, s, 0.0},
        glm::dvec3{-s, c, 0.0},
        glm::dvec3{0.0, 0.0, 1.0}
    };
}

glm::dvec3 Orient::globalNormal() const noexcept {
    glm::dvec3 n_g = bearingRotation() * inclinationRotation() * boreholeNormal();

    // Полюс берётся в нижней полусфере (ось z направлена вверх)
    if (n_g.z > 0.0) {
        n_g = -n_g;
    }
    return n_g;
}

PoleOrientation Orient::trendAndPlunge() const noexcept {
    const glm::dvec3 n_g = globalNormal();

    const double horizontal = std::sqrt(n_g.x * n_g.x + n_g.y * n_g.y);
    double apparent_trend = 0.0;
    if (horizontal > kDegenerateHorizontal) {
        apparent_trend = std::acos(std::clamp(n_g.x / horizontal, -1.0, 1.0));
    }

    double trend = (n_g.y <= 0.0)
        ? kHalfPi + apparent_trend
        : kHalfPi - apparent_trend;
    if (trend < 0.0) {
        trend += kTwoPi;
    }
    // -1e-16 + 2π округляется ровно до 2π
    if (trend >= kTwoPi) {
        trend -= kTwoPi;
    }

    const double plunge = -std::asin(std::clamp(n_g.z, -1.0, 1.0));

    return {Radians{trend}, Radians{plunge}};
}

Plane Orient::toPlane() const {
    const auto pole = trendAndPlunge();

    // Перевод в градусы может округлить 2π - 1 ulp до 360
    Degrees trend = pole.trend.toDegrees();
    if (trend.value >= validation_limits::kMaxAzimuth) {
        trend = Degrees{trend.value - validation_limits::kMaxAzimuth};
    }
    // asin(1) в градусах может дать 90 + 1 ulp
    const Degrees plunge{std::min(pole.plunge.toDegrees().value, validation_limits::kMaxAcute)};

    const Degrees strike = strikeFromTrend(trend);
    const Degrees dip = dipFromPlunge(plunge);

    return Plane(strike, dip, dipDirectionFromStrike(strike), trend, plunge);
}

} // namespace coreorient::core
