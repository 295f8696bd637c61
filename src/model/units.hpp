/**
 * @file units.hpp
 * @brief Строго типизированные углы и глубины
 * @author Yan Bubenok <yan@bubenok.com>
 *
 * Углы керна и ствола хранятся в градусах, вся тригонометрия
 * ориентировки выполняется в радианах. Обёртки не дают перепутать
 * одно с другим. Литералы: 45.0_deg, 0.5_rad, 12.5_m
 */

#pragma once

#include <cmath>
#include <compare>
#include <numbers>

namespace coreorient::model {

struct Radians;

inline constexpr double kDegreesPerRadian = 180.0 / std::numbers::pi;

/**
 * @brief Угол в градусах
 */
struct Degrees {
    double value;

    constexpr explicit Degrees(double v = 0.0) noexcept : value(v) {}

    [[nodiscard]] constexpr Radians toRadians() const noexcept;

    constexpr Degrees operator+(Degrees other) const noexcept {
        return Degrees{value + other.value};
    }

    constexpr Degrees operator-(Degrees other) const noexcept {
        return Degrees{value - other.value};
    }

    constexpr Degrees operator-() const noexcept {
        return Degrees{-value};
    }

    constexpr auto operator<=>(const Degrees& other) const noexcept = default;
};

/**
 * @brief Угол в радианах
 */
struct Radians {
    double value;

    constexpr explicit Radians(double v = 0.0) noexcept : value(v) {}

    [[nodiscard]] constexpr Degrees toDegrees() const noexcept {
        return Degrees{value * kDegreesPerRadian};
    }

    constexpr Radians operator+(Radians other) const noexcept {
        return Radians{value + other.value};
    }

    constexpr Radians operator-(Radians other) const noexcept {
        return Radians{value - other.value};
    }

    constexpr Radians operator-() const noexcept {
        return Radians{-value};
    }

    constexpr auto operator<=>(const Radians& other) const noexcept = default;
};

constexpr Radians Degrees::toRadians() const noexcept {
    return Radians{value / kDegreesPerRadian};
}

/**
 * @brief Глубина по стволу в метрах
 */
struct Meters {
    double value;

    constexpr explicit Meters(double v = 0.0) noexcept : value(v) {}

    constexpr Meters operator+(Meters other) const noexcept {
        return Meters{value + other.value};
    }

    constexpr Meters operator-(Meters other) const noexcept {
        return Meters{value - other.value};
    }

    constexpr Meters operator/(double scalar) const noexcept {
        return Meters{value / scalar};
    }

    constexpr auto operator<=>(const Meters& other) const noexcept = default;
};

/**
 * @brief Середина между двумя глубинами
 */
[[nodiscard]] constexpr Meters midpoint(Meters a, Meters b) noexcept {
    return a + (b - a) / 2.0;
}

namespace literals {

constexpr Degrees operator""_deg(long double v) noexcept {
    return Degrees{static_cast<double>(v)};
}

constexpr Degrees operator""_deg(unsigned long long v) noexcept {
    return Degrees{static_cast<double>(v)};
}

constexpr Radians operator""_rad(long double v) noexcept {
    return Radians{static_cast<double>(v)};
}

constexpr Meters operator""_m(long double v) noexcept {
    return Meters{static_cast<double>(v)};
}

constexpr Meters operator""_m(unsigned long long v) noexcept {
    return Meters{static_cast<double>(v)};
}

} // namespace literals

[[nodiscard]] inline double sin(Radians r) noexcept { return std::sin(r.value); }
[[nodiscard]] inline double cos(Radians r) noexcept { return std::cos(r.value); }

} // namespace coreorient::model
