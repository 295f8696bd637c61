/**
 * @file validation.hpp
 * @brief Проверка диапазонов углов и данных инклинометрии
 * @author Yan Bubenok <yan@bubenok.com>
 */

#pragma once

#include "measurement.hpp"
#include <cmath>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace coreorient::model {

/**
 * @brief Константы валидации
 */
namespace validation_limits {
    constexpr double kMinAzimuth = 0.0;        ///< Азимут, простирание, тренд
    constexpr double kMaxAzimuth = 360.0;
    constexpr double kMinInclination = -90.0;  ///< Наклон ствола от горизонта
    constexpr double kMaxInclination = 90.0;
    constexpr double kMinAcute = 0.0;          ///< Alpha, падение, погружение
    constexpr double kMaxAcute = 90.0;
    constexpr double kMinDepth = 0.0;
}

/**
 * @brief Значение вне допустимого диапазона
 *
 * Границы включаются: значение, равное min или max, корректно.
 */
class OutOfRangeError : public std::runtime_error {
public:
    OutOfRangeError(std::string field, double value, double min, double max)
        : std::runtime_error(formatMessage(field, value, min, max))
        , field_(std::move(field))
        , value_(value)
        , min_(min)
        , max_(max) {}

    [[nodiscard]] const std::string& field() const noexcept { return field_; }
    [[nodiscard]] double value() const noexcept { return value_; }
    [[nodiscard]] double min() const noexcept { return min_; }
    [[nodiscard]] double max() const noexcept { return max_; }

private:
    static std::string formatMessage(const std::string& field, double value, double min, double max) {
        std::ostringstream oss;
        oss << "Значение " << field << " = " << value
            << " вне допустимого диапазона [" << min << ", " << max << "]";
        return oss.str();
    }

    std::string field_;
    double value_;
    double min_;
    double max_;
};

/**
 * @brief Проверка попадания значения в замкнутый интервал [min, max]
 *
 * @param value Проверяемое значение
 * @param min Нижняя граница (включительно)
 * @param max Верхняя граница (включительно)
 * @param field Имя поля для сообщения об ошибке
 * @return То же значение
 * @throws OutOfRangeError Если значение вне интервала или NaN
 */
inline double validateRange(double value, double min, double max, const std::string& field = "value") {
    if (std::isnan(value) || value < min || value > max) {
        throw OutOfRangeError(field, value, min, max);
    }
    return value;
}

inline Degrees validateRange(Degrees value, double min, double max, const std::string& field = "value") {
    return Degrees{validateRange(value.value, min, max, field)};
}

/**
 * @brief Тип ошибки валидации станций
 */
enum class ValidationErrorType {
    MissingRequiredField,   ///< Нет ни одной станции
    FirstDepthNotZero,      ///< Первая станция не на устье
    NonMonotonicDepth,      ///< Немонотонные глубины
    DuplicateDepth,         ///< Повторяющаяся глубина (нулевой интервал)
    InvalidValue            ///< NaN или бесконечность
};

/**
 * @brief Ошибка валидации
 */
struct ValidationError {
    ValidationErrorType type;
    std::string field;                  ///< Имя поля с ошибкой
    std::string message;                ///< Описание ошибки
    std::optional<size_t> point_index;  ///< Индекс станции

    [[nodiscard]] std::string toString() const {
        if (point_index.has_value()) {
            return "Станция " + std::to_string(*point_index + 1) + ": " + message;
        }
        return message;
    }
};

/**
 * @brief Результат валидации
 */
struct ValidationResult {
    bool is_valid = true;
    std::vector<ValidationError> errors;

    void addError(ValidationErrorType type, const std::string& field,
                  const std::string& message, std::optional<size_t> point_idx = std::nullopt) {
        is_valid = false;
        errors.push_back({type, field, message, point_idx});
    }

    [[nodiscard]] bool hasErrors() const noexcept { return !errors.empty(); }

    /**
     * @brief Все сообщения одной строкой через "; "
     */
    [[nodiscard]] std::string summary() const {
        std::string text;
        for (size_t i = 0; i < errors.size(); ++i) {
            if (i > 0) text += "; ";
            text += errors[i].toString();
        }
        return text;
    }
};

/**
 * @brief Валидация списка станций инклинометрии
 *
 * Проверяет: список не пуст, первая глубина ровно 0.0, глубины конечны
 * и строго возрастают. Собирает все найденные ошибки, а не только первую.
 * Диапазоны углов проверяются отдельно через validateRange.
 */
[[nodiscard]] inline ValidationResult validateSurveyStations(const SurveyStationList& stations) {
    ValidationResult result;

    if (stations.empty()) {
        result.addError(ValidationErrorType::MissingRequiredField, "stations",
            "Отсутствуют станции инклинометрии");
        return result;
    }

    if (stations.front().depth.value != 0.0) {
        std::ostringstream oss;
        oss << "Глубина первой станции должна быть 0.0, получено " << stations.front().depth.value;
        result.addError(ValidationErrorType::FirstDepthNotZero, "depth", oss.str(), 0);
    }

    for (size_t i = 0; i < stations.size(); ++i) {
        const auto& st = stations[i];

        if (!std::isfinite(st.depth.value)) {
            result.addError(ValidationErrorType::InvalidValue, "depth",
                "Некорректное значение глубины", i);
            continue;
        }

        if (i == 0) continue;

        double prev_depth = stations[i - 1].depth.value;
        double curr_depth = st.depth.value;
        if (curr_depth < prev_depth) {
            std::ostringstream oss;
            oss << "Глубина " << curr_depth << " м меньше предыдущей (" << prev_depth << " м)";
            result.addError(ValidationErrorType::NonMonotonicDepth, "depth", oss.str(), i);
        } else if (curr_depth == prev_depth) {
            std::ostringstream oss;
            oss << "Глубина " << curr_depth << " м повторяет предыдущую станцию";
            result.addError(ValidationErrorType::DuplicateDepth, "depth", oss.str(), i);
        }
    }

    return result;
}

} // namespace coreorient::model
