/**
 * @file angle_utils.hpp
 * @brief Связи между углами плоскости: простирание, падение, полюс
 * @author Yan Bubenok <yan@bubenok.com>
 *
 * Все функции проверяют входной угол и бросают OutOfRangeError,
 * если он вне своего диапазона. Результат приводится к [0°, 360°)
 * прибавлением и однократным вычитанием 360°.
 */

#pragma once

#include "model/types.hpp"

namespace coreorient::core {

using namespace coreorient::model;

/**
 * @brief Поворот по часовой стрелке на заданный угол
 *
 * input + add; если сумма достигла max, из неё вычитается max.
 *
 * @param input Исходный угол, проверяется на [min, max]
 * @param add Добавляемый угол
 * @throws OutOfRangeError Если input вне [min, max]
 */
[[nodiscard]] Degrees clockwiseFromInput(
    Degrees input,
    Degrees add,
    double min = 0.0,
    double max = 360.0,
    const std::string& field = "angle"
);

/**
 * @brief Азимут падения по простиранию: strike + 90°
 */
[[nodiscard]] Degrees dipDirectionFromStrike(Degrees strike);

/**
 * @brief Тренд полюса по простиранию: strike + 270° (т.е. strike - 90°)
 */
[[nodiscard]] Degrees trendFromStrike(Degrees strike);

/**
 * @brief Простирание по тренду полюса: trend + 90°
 */
[[nodiscard]] Degrees strikeFromTrend(Degrees trend);

/**
 * @brief Дополнительный угол 90° - angle, angle в [0°, 90°]
 */
[[nodiscard]] Degrees perpendicularAngle(Degrees angle, const std::string& field = "angle");

/**
 * @brief Погружение полюса по углу падения: 90° - dip
 */
[[nodiscard]] Degrees plungeFromDip(Degrees dip);

/**
 * @brief Угол падения по погружению полюса: 90° - plunge
 */
[[nodiscard]] Degrees dipFromPlunge(Degrees plunge);

} // namespace coreorient::core
