/**
 * @file csv_writer.hpp
 * @brief Экспорт ориентированных плоскостей в CSV
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include "model/plane.hpp"
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace coreorient::io {

using namespace coreorient::model;

/**
 * @brief Поле для экспорта
 */
enum class ExportField {
    Depth,          ///< Глубина замера
    Strike,         ///< Простирание
    Dip,            ///< Угол падения
    DipDirection,   ///< Азимут падения
    Trend,          ///< Азимут полюса
    Plunge          ///< Погружение полюса
};

/**
 * @brief Опции экспорта в CSV
 */
struct CsvExportOptions {
    char delimiter = ',';              ///< Разделитель полей
    char decimal_separator = '.';      ///< Десятичный разделитель
    int decimal_places = 2;            ///< Знаков после запятой
    bool include_header = true;        ///< Включить заголовок
    bool include_depth = false;        ///< Первая колонка: глубина замера
};

/**
 * @brief Опции экспорта по настройкам обработки
 */
[[nodiscard]] CsvExportOptions exportOptionsFromSettings(const OrientationSettings& settings) noexcept;

/**
 * @brief Ошибка записи CSV
 */
class CsvWriteError : public std::runtime_error {
public:
    explicit CsvWriteError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Формирование CSV с плоскостями
 *
 * Одна строка на плоскость в порядке входного списка.
 *
 * @param planes Плоскости
 * @param depths Глубины замеров (нужны только при include_depth)
 * @param options Опции экспорта
 * @throws CsvWriteError Если include_depth и число глубин не совпадает с числом плоскостей
 */
[[nodiscard]] std::string formatPlanesCsv(
    const PlaneList& planes,
    const std::vector<Meters>& depths,
    const CsvExportOptions& options = {}
);

/**
 * @brief Экспорт плоскостей в CSV (атомарная запись)
 *
 * @throws CsvWriteError При ошибке записи
 */
void writeCsvPlanes(
    const PlaneList& planes,
    const std::filesystem::path& path,
    const CsvExportOptions& options = {},
    const std::vector<Meters>& depths = {}
);

/**
 * @brief Имя колонки в заголовке
 */
[[nodiscard]] std::string_view getFieldName(ExportField field) noexcept;

/**
 * @brief Набор полей для экспорта
 */
[[nodiscard]] std::vector<ExportField> getExportFields(bool include_depth);

} // namespace coreorient::io
