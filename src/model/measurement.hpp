/**
 * @file measurement.hpp
 * @brief Исходные данные: замеры на керне и станции инклинометрии
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include "types.hpp"
#include <vector>

namespace coreorient::model {

/**
 * @brief Замер структуры на ориентированном керне (исходные данные)
 *
 * Alpha: острый двугранный угол между плоскостью трещины и осью керна.
 * Beta: угол по часовой стрелке (взгляд вниз по стволу) от ориентирной
 * линии до нижней точки перегиба следа трещины.
 */
struct RawMeasurement {
    Meters depth{0.0};     ///< Глубина по стволу, >= 0
    Degrees alpha{0.0};    ///< [0°, 90°]
    Degrees beta{0.0};     ///< [0°, 360°]

    RawMeasurement() = default;

    RawMeasurement(Meters d, Degrees a, Degrees b)
        : depth(d), alpha(a), beta(b) {}
};

/**
 * @brief Станция инклинометрии (ориентация ствола на глубине)
 *
 * Инклинация отсчитывается от горизонта и отрицательна для ствола,
 * направленного вниз.
 */
struct SurveyStation {
    Meters depth{0.0};          ///< Глубина по стволу
    Degrees bearing{0.0};       ///< Азимут ствола [0°, 360°]
    Degrees inclination{0.0};   ///< Наклон ствола [-90°, 90°]

    SurveyStation() = default;

    SurveyStation(Meters d, Degrees bear, Degrees inc)
        : depth(d), bearing(bear), inclination(inc) {}
};

using RawMeasurementList = std::vector<RawMeasurement>;

/**
 * @brief Станции инклинометрии, упорядоченные по глубине
 *
 * Первая станция обязана иметь глубину 0.0.
 */
using SurveyStationList = std::vector<SurveyStation>;

} // namespace coreorient::model
