/**
 * @file depth_intervals.hpp
 * @brief Привязка замеров керна к станциям инклинометрии по глубине
 *
 * Каждая станция отвечает за интервал глубин от середины расстояния
 * до предыдущей станции до середины расстояния до следующей.
 */

#pragma once

#include "model/measurement.hpp"
#include <optional>
#include <vector>

namespace coreorient::core {

using namespace coreorient::model;

/**
 * @brief Интервал глубин, закреплённый за одной станцией
 *
 * Верхняя (меньшая) граница включается, нижняя не включается, кроме
 * интервала последней станции: он замкнут, чтобы покрыть её глубину.
 * Замер ровно на середине между станциями относится к более глубокой.
 */
struct DepthInterval {
    Meters low{0.0};
    Meters high{0.0};
    bool includes_high = false;

    /**
     * @brief Сравнение глубины с интервалом
     * @return <0 если глубина выше интервала, 0 если внутри, >0 если ниже
     */
    [[nodiscard]] int compare(Meters depth) const noexcept {
        if (depth.value < low.value) {
            return -1;
        }
        if (depth.value < high.value || (includes_high && depth.value == high.value)) {
            return 0;
        }
        return 1;
    }

    [[nodiscard]] bool contains(Meters depth) const noexcept {
        return compare(depth) == 0;
    }
};

using DepthIntervalList = std::vector<DepthInterval>;

/**
 * @brief Построение интервалов по середине расстояния между станциями
 *
 * Станции должны быть проверены validateSurveyStations: непустой список,
 * строго возрастающие глубины. Интервалы идут подряд, без разрывов и
 * перекрытий, и покрывают [depth[0], depth[n-1]].
 *
 * @param stations Станции инклинометрии
 * @return Интервалы в порядке станций
 */
[[nodiscard]] DepthIntervalList buildDepthIntervals(const SurveyStationList& stations);

/**
 * @brief Поиск интервала, содержащего глубину (двоичный поиск)
 *
 * @return Индекс станции или nullopt, если глубина вне интервалов
 */
[[nodiscard]] std::optional<size_t> findStationIndex(
    const DepthIntervalList& intervals,
    Meters depth
) noexcept;

} // namespace coreorient::core
