/**
 * @file plane_json.hpp
 * @brief JSON-представление плоскостей и отчёта по скважине
 */

#pragma once

#include "core/borehole.hpp"
#include <filesystem>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace coreorient::io {

using namespace coreorient::model;

/**
 * @brief Ошибка записи JSON-отчёта
 */
class ReportError : public std::runtime_error {
public:
    explicit ReportError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Плоскость в JSON: {strike, dip, dip_direction, trend, plunge}
 */
[[nodiscard]] nlohmann::json planeToJson(const Plane& plane);

/**
 * @brief Плоскость из JSON (отсутствующие поля вычисляются)
 * @throws ReportError Если нет strike или dip
 * @throws OutOfRangeError Если значение вне диапазона
 */
[[nodiscard]] Plane planeFromJson(const nlohmann::json& j);

/**
 * @brief Отчёт по скважине
 *
 * {"reference_line": "top", "stations": [...], "planes": [...]}, где
 * каждая плоскость дополнена глубиной замера и индексом станции.
 *
 * @param borehole Рассчитанная скважина
 * @param measurements Замеры, по которым она построена
 * @throws ReportError Если число замеров не совпадает с числом плоскостей
 */
[[nodiscard]] nlohmann::json boreholeReportToJson(
    const core::Borehole& borehole,
    const RawMeasurementList& measurements
);

/**
 * @brief Запись JSON в файл (атомарно, с отступами)
 * @throws ReportError При ошибке записи
 */
void writeJsonReport(const std::filesystem::path& path, const nlohmann::json& report, int indent = 2);

} // namespace coreorient::io
