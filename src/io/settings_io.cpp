/**
 * @file settings_io.cpp
 * @brief Реализация чтения и записи настроек
 */

#include "settings_io.hpp"
#include "file_utils.hpp"
#include <fstream>
#include <nlohmann/json.hpp>

namespace coreorient::io {

using json = nlohmann::json;

namespace {

constexpr int kMaxDecimalPlaces = 12;

char charFromJson(const json& j, const char* key) {
    const auto value = j.get<std::string>();
    if (value == "tab" || value == "\t") {
        return '\t';
    }
    if (value.size() != 1) {
        throw SettingsError(std::string("Значение \"") + key +
                            "\" должно быть одним символом: \"" + value + "\"");
    }
    return value.front();
}

std::string charToJson(char c) {
    return c == '\t' ? std::string("tab") : std::string(1, c);
}

OrientationSettings settingsFromJsonInternal(const json& j) {
    if (!j.is_object()) {
        throw SettingsError("Файл настроек должен содержать JSON-объект");
    }

    OrientationSettings s;

    try {
        if (j.contains("reference_line")) {
            s.reference_line = parseReferenceLine(j["reference_line"].get<std::string>());
        }

        if (j.contains("csv")) {
            const auto& csv = j["csv"];
            if (!csv.is_object()) {
                throw SettingsError("Раздел \"csv\" должен быть объектом");
            }
            if (csv.contains("delimiter")) {
                s.csv_delimiter = charFromJson(csv["delimiter"], "delimiter");
            }
            if (csv.contains("decimal_separator")) {
                s.csv_decimal_separator = charFromJson(csv["decimal_separator"], "decimal_separator");
            }
            s.csv_decimal_places = csv.value("decimal_places", s.csv_decimal_places);
            s.csv_include_depth = csv.value("include_depth", s.csv_include_depth);
        }
    } catch (const json::exception& e) {
        throw SettingsError("Некорректный тип значения в настройках: " + std::string(e.what()));
    } catch (const std::invalid_argument& e) {
        throw SettingsError(e.what());
    }

    if (s.csv_decimal_places < 0 || s.csv_decimal_places > kMaxDecimalPlaces) {
        throw SettingsError("decimal_places должно быть от 0 до " + std::to_string(kMaxDecimalPlaces));
    }
    if (s.csv_delimiter == s.csv_decimal_separator) {
        throw SettingsError("Разделитель полей совпадает с десятичным разделителем");
    }

    return s;
}

json settingsToJsonInternal(const OrientationSettings& s) {
    json j;
    j["reference_line"] = toString(s.reference_line);
    j["csv"] = {
        {"delimiter", charToJson(s.csv_delimiter)},
        {"decimal_separator", charToJson(s.csv_decimal_separator)},
        {"decimal_places", s.csv_decimal_places},
        {"include_depth", s.csv_include_depth}
    };
    return j;
}

} // anonymous namespace

OrientationSettings loadSettings(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw SettingsError("Не удалось открыть файл настроек: " + path.string());
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw SettingsError("Ошибка парсинга JSON: " + std::string(e.what()));
    }

    return settingsFromJsonInternal(j);
}

OrientationSettings settingsFromJson(const std::string& json_str) {
    json j;
    try {
        j = json::parse(json_str);
    } catch (const json::parse_error& e) {
        throw SettingsError("Ошибка парсинга JSON: " + std::string(e.what()));
    }

    return settingsFromJsonInternal(j);
}

std::string settingsToJson(const OrientationSettings& settings, int indent) {
    return settingsToJsonInternal(settings).dump(indent);
}

void saveSettings(const OrientationSettings& settings, const std::filesystem::path& path) {
    try {
        atomicWrite(path, settingsToJson(settings) + "\n");
    } catch (const std::runtime_error& e) {
        throw SettingsError("Ошибка сохранения настроек: " + std::string(e.what()));
    }
}

} // namespace coreorient::io
