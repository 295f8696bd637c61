/**
 * @file plane.hpp
 * @brief Ориентированная плоскость и её полюс
 */

#pragma once

#include "types.hpp"
#include <vector>

namespace coreorient::model {

/**
 * @brief Линейный элемент (полюс плоскости)
 *
 * Тренд: азимут проекции направленной вниз нормали на горизонт,
 * по часовой стрелке от севера, [0°, 360°]. Равен strike - 90°.
 * Погружение: угол нормали ниже горизонта, [0°, 90°]. Равно 90° - dip.
 */
struct Lineation {
    Degrees trend{0.0};
    Degrees plunge{0.0};

    Lineation() = default;

    /**
     * @throws OutOfRangeError Если trend или plunge вне диапазона
     */
    Lineation(Degrees trend_, Degrees plunge_);
};

/**
 * @brief Плоская структура (трещина, контакт, сланцеватость)
 *
 * Хранит простирание, падение, азимут падения и полюс явно.
 * Все четыре выводятся из (strike, dip): неуказанные в конструкторе
 * поля вычисляются, указанные проверяются только на свой диапазон.
 */
class Plane {
public:
    /**
     * @brief Создать плоскость
     *
     * @param strike Простирание [0°, 360°]
     * @param dip Угол падения [0°, 90°]
     * @param dip_direction Азимут падения (по умолчанию strike + 90°)
     * @param trend Тренд полюса (по умолчанию strike - 90°)
     * @param plunge Погружение полюса (по умолчанию 90° - dip)
     * @throws OutOfRangeError Если любое поле вне диапазона
     */
    Plane(Degrees strike,
          Degrees dip,
          OptionalAngle dip_direction = std::nullopt,
          OptionalAngle trend = std::nullopt,
          OptionalAngle plunge = std::nullopt);

    /**
     * @brief Плоскость по замеру на ориентированном керне
     *
     * Эквивалентно Orient(...).toPlane().
     *
     * @param bearing Азимут ствола [0°, 360°]
     * @param inclination Наклон ствола [-90°, 90°], вниз отрицательный
     * @param alpha Угол alpha [0°, 90°]
     * @param beta Угол beta [0°, 360°]
     * @param line Положение ориентирной линии
     */
    [[nodiscard]] static Plane alphaBeta(
        Degrees bearing,
        Degrees inclination,
        Degrees alpha,
        Degrees beta,
        ReferenceLine line = ReferenceLine::Top
    );

    [[nodiscard]] Degrees strike() const noexcept { return strike_; }
    [[nodiscard]] Degrees dip() const noexcept { return dip_; }
    [[nodiscard]] Degrees dipDirection() const noexcept { return dip_direction_; }
    [[nodiscard]] const Lineation& pole() const noexcept { return pole_; }

private:
    Degrees strike_;
    Degrees dip_;
    Degrees dip_direction_;
    Lineation pole_;
};

using PlaneList = std::vector<Plane>;

} // namespace coreorient::model
