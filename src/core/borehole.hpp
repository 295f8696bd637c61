/**
 * @file borehole.hpp
 * @brief Скважина: станции инклинометрии и ориентированные замеры
 *
 * Скважина строится один раз по станциям и замерам керна и сразу
 * рассчитывает плоскости для всех замеров. Изменять её после создания
 * нельзя.
 */

#pragma once

#include "depth_intervals.hpp"
#include "model/plane.hpp"
#include "model/validation.hpp"
#include <stdexcept>
#include <string>

namespace coreorient::core {

using namespace coreorient::model;

/**
 * @brief Некорректный список станций инклинометрии
 *
 * Пустой список, первая глубина не 0.0, немонотонные или повторяющиеся
 * глубины. Содержит полный отчёт валидации.
 */
class InvalidSurveyDataError : public std::runtime_error {
public:
    explicit InvalidSurveyDataError(ValidationResult report)
        : std::runtime_error("Некорректные данные инклинометрии: " + report.summary())
        , report_(std::move(report)) {}

    [[nodiscard]] const ValidationResult& report() const noexcept { return report_; }

private:
    ValidationResult report_;
};

/**
 * @brief Глубина замера вне интервалов станций
 */
class DepthOutOfSurveyRangeError : public std::runtime_error {
public:
    DepthOutOfSurveyRangeError(Meters depth, size_t measurement_index);

    [[nodiscard]] Meters depth() const noexcept { return depth_; }
    [[nodiscard]] size_t measurementIndex() const noexcept { return measurement_index_; }

private:
    Meters depth_;
    size_t measurement_index_;
};

/**
 * @brief Результат привязки и пересчёта замеров
 */
struct OrientedMeasurements {
    PlaneList planes;                  ///< В порядке входных замеров
    std::vector<size_t> station_index; ///< Станция для каждого замера
};

/**
 * @brief Привязка замеров к станциям и пересчёт в плоскости
 *
 * Все замеры либо пересчитываются, либо операция завершается ошибкой;
 * частичный результат не возвращается.
 *
 * @param measurements Замеры керна
 * @param stations Станции инклинометрии (первая на глубине 0.0)
 * @param line Положение ориентирной линии
 * @throws InvalidSurveyDataError До обработки первого замера
 * @throws OutOfRangeError Угол станции или замера вне диапазона
 * @throws DepthOutOfSurveyRangeError Замер вне интервалов станций
 */
[[nodiscard]] OrientedMeasurements orientMeasurements(
    const RawMeasurementList& measurements,
    const SurveyStationList& stations,
    ReferenceLine line
);

/**
 * @brief Скважина с ориентированными замерами
 */
class Borehole {
public:
    /**
     * @throws InvalidSurveyDataError, OutOfRangeError, DepthOutOfSurveyRangeError
     */
    Borehole(ReferenceLine line,
             const RawMeasurementList& measurements,
             SurveyStationList stations);

    [[nodiscard]] const PlaneList& orientedMeasurements() const noexcept { return result_.planes; }
    [[nodiscard]] const std::vector<size_t>& stationAssignments() const noexcept { return result_.station_index; }
    [[nodiscard]] ReferenceLine referenceLine() const noexcept { return reference_line_; }
    [[nodiscard]] const SurveyStationList& stations() const noexcept { return stations_; }

private:
    ReferenceLine reference_line_;
    SurveyStationList stations_;
    OrientedMeasurements result_;
};

} // namespace coreorient::core
