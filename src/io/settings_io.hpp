/**
 * @file settings_io.hpp
 * @brief Чтение и запись настроек обработки (JSON)
 */

#pragma once

#include "model/types.hpp"
#include <filesystem>
#include <stdexcept>
#include <string>

namespace coreorient::io {

using namespace coreorient::model;

/**
 * @brief Ошибка чтения настроек
 */
class SettingsError : public std::runtime_error {
public:
    explicit SettingsError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Загрузка настроек из файла
 *
 * Все ключи необязательны, отсутствующие берутся по умолчанию:
 * @code
 * {
 *   "reference_line": "top",
 *   "csv": {"delimiter": ",", "decimal_separator": ".",
 *           "decimal_places": 2, "include_depth": false}
 * }
 * @endcode
 *
 * @throws SettingsError При ошибке чтения, парсинга или недопустимом значении
 */
[[nodiscard]] OrientationSettings loadSettings(const std::filesystem::path& path);

/**
 * @brief Настройки из JSON-строки
 * @throws SettingsError При ошибке парсинга или недопустимом значении
 */
[[nodiscard]] OrientationSettings settingsFromJson(const std::string& json_str);

/**
 * @brief Настройки в JSON-строку (с отступами)
 */
[[nodiscard]] std::string settingsToJson(const OrientationSettings& settings, int indent = 2);

/**
 * @brief Сохранение настроек (атомарная запись)
 * @throws SettingsError При ошибке записи
 */
void saveSettings(const OrientationSettings& settings, const std::filesystem::path& path);

} // namespace coreorient::io
