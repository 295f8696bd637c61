/**
 * @file types.hpp
 * @brief Базовые типы и перечисления
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include "units.hpp"
#include <optional>
#include <string>

namespace coreorient::model {

/**
 * @brief Опциональный угол
 *
 * std::nullopt означает "вычислить из остальных полей".
 */
using OptionalAngle = std::optional<Degrees>;

/**
 * @brief Положение ориентирной линии на керне
 *
 * Определяет, от какой образующей керна отсчитывается угол beta.
 */
enum class ReferenceLine {
    Top,     ///< Линия по верхней образующей (кровля керна)
    Bottom   ///< Линия по нижней образующей, beta смещается на 180°
};

/**
 * @brief Настройки обработки ориентированного керна
 */
struct OrientationSettings {
    ReferenceLine reference_line = ReferenceLine::Top;
    char csv_delimiter = ',';           ///< Разделитель полей выходного CSV
    char csv_decimal_separator = '.';   ///< Десятичный разделитель выходного CSV
    int csv_decimal_places = 2;         ///< Знаков после запятой
    bool csv_include_depth = false;     ///< Добавлять колонку глубины замера
};

/**
 * @brief Преобразование ReferenceLine в строку
 */
[[nodiscard]] inline std::string toString(ReferenceLine line) {
    switch (line) {
        case ReferenceLine::Top: return "top";
        case ReferenceLine::Bottom: return "bottom";
    }
    return "top";
}

/**
 * @brief Парсинг ReferenceLine из строки ("top"/"bottom", без учёта регистра)
 * @throws std::invalid_argument Для неизвестного значения
 */
[[nodiscard]] ReferenceLine parseReferenceLine(const std::string& str);

} // namespace coreorient::model
