/**
 * @file orient.hpp
 * @brief Пересчёт углов alpha/beta керна в ориентировку плоскости
 *
 * Определения углов: Computers & Geosciences, ScienceDirect PII
 * S0098300413000551. Нормаль к трещине строится в системе координат
 * ствола и переводится в глобальную систему двумя поворотами
 * n_g = Rz * Ry * n_bh.
 */

#pragma once

#include "model/plane.hpp"
#include <glm/glm.hpp>

namespace coreorient::core {

using namespace coreorient::model;

/**
 * @brief Ориентировка полюса плоскости в радианах
 */
struct PoleOrientation {
    Radians trend{0.0};    ///< [0, 2π)
    Radians plunge{0.0};   ///< [0, π/2]
};

/**
 * @brief Замер alpha/beta вместе с ориентацией ствола в точке замера
 *
 * Неизменяемое значение: все углы проверяются в конструкторе и хранятся
 * в радианах. Бета уже приведена к верхней ориентирной линии.
 */
class Orient {
public:
    /**
     * @param bearing Азимут ствола [0°, 360°]
     * @param inclination Наклон ствола от горизонта [-90°, 90°], вниз отрицательный
     * @param alpha Угол между трещиной и осью керна [0°, 90°]
     * @param beta Угол от ориентирной линии до нижней точки эллипса [0°, 360°]
     * @param line Положение ориентирной линии (Bottom добавляет 180° к beta)
     * @throws OutOfRangeError С именем поля, вышедшего за диапазон
     */
    Orient(Degrees bearing,
           Degrees inclination,
           Degrees alpha,
           Degrees beta,
           ReferenceLine line = ReferenceLine::Top);

    /**
     * @brief Тренд и погружение полюса (нормали, направленной вниз)
     *
     * Если горизонтальная составляющая нормали нулевая (горизонтальная
     * плоскость), азимут не определён и кажущийся тренд принимается за 0.
     */
    [[nodiscard]] PoleOrientation trendAndPlunge() const noexcept;

    /**
     * @brief Ориентированная плоскость в градусах
     */
    [[nodiscard]] Plane toPlane() const;

    /// Нормаль к трещине в системе ствола (ось ствола по +x)
    [[nodiscard]] glm::dvec3 boreholeNormal() const noexcept;

    /// Нормаль к трещине в глобальной системе, направленная вниз
    [[nodiscard]] glm::dvec3 globalNormal() const noexcept;

    /// Поворот вокруг оси y на (π/2 - inclination)
    [[nodiscard]] glm::dmat3 inclinationRotation() const noexcept;

    /// Поворот вокруг оси z на (π/2 - bearing)
    [[nodiscard]] glm::dmat3 bearingRotation() const noexcept;

    [[nodiscard]] Radians bearing() const noexcept { return bearing_; }
    [[nodiscard]] Radians inclination() const noexcept { return inclination_; }
    [[nodiscard]] Radians alpha() const noexcept { return alpha_; }
    [[nodiscard]] Radians beta() const noexcept { return beta_; }

private:
    Radians bearing_;
    Radians inclination_;
    Radians alpha_;
    Radians beta_;
};

/**
 * @brief Beta, приведённая к верхней ориентирной линии
 *
 * Для Bottom: (beta + 180°) mod 360°, для Top без изменений.
 */
[[nodiscard]] Degrees adjustBetaForReferenceLine(Degrees beta, ReferenceLine line);

} // namespace coreorient::core
