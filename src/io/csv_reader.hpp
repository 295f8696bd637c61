/**
 * @file csv_reader.hpp
 * @brief Импорт станций инклинометрии и замеров керна из CSV
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include "model/measurement.hpp"
#include <filesystem>
#include <istream>
#include <optional>
#include <stdexcept>
#include <string>

namespace coreorient::io {

using namespace coreorient::model;

/**
 * @brief Опции чтения CSV
 */
struct CsvReadOptions {
    std::optional<char> delimiter;     ///< Разделитель полей (nullopt = автоопределение)
    char decimal_separator = '.';      ///< Десятичный разделитель
    size_t skip_lines = 0;             ///< Пропустить строк в начале
};

/**
 * @brief Ошибка чтения CSV
 */
class CsvReadError : public std::runtime_error {
public:
    CsvReadError(const std::string& message, size_t line = 0)
        : std::runtime_error(line > 0
            ? "Строка " + std::to_string(line) + ": " + message
            : message)
        , line_(line) {}

    [[nodiscard]] size_t line() const noexcept { return line_; }

private:
    size_t line_;
};

/**
 * @brief Чтение станций инклинометрии (depth, bearing, inclination)
 *
 * Колонки определяются по заголовку (depth/md, bearing/azimuth/az,
 * inclination/incl), без заголовка по порядку.
 *
 * @throws CsvReadError При ошибке чтения или значении вне диапазона
 */
[[nodiscard]] SurveyStationList readSurveyStations(
    const std::filesystem::path& path,
    const CsvReadOptions& options = {}
);

/**
 * @brief Разбор станций инклинометрии из потока
 */
[[nodiscard]] SurveyStationList parseSurveyStations(
    std::istream& input,
    const CsvReadOptions& options = {}
);

/**
 * @brief Чтение замеров керна (depth, alpha, beta)
 *
 * @throws CsvReadError При ошибке чтения или значении вне диапазона
 */
[[nodiscard]] RawMeasurementList readRawMeasurements(
    const std::filesystem::path& path,
    const CsvReadOptions& options = {}
);

/**
 * @brief Разбор замеров керна из потока
 */
[[nodiscard]] RawMeasurementList parseRawMeasurements(
    std::istream& input,
    const CsvReadOptions& options = {}
);

} // namespace coreorient::io
