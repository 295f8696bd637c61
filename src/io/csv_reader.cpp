/**
 * @file csv_reader.cpp
 * @brief Реализация импорта станций и замеров из CSV
 * @author Yan Bubenok <yan@bubenok.com>
 */

#include "csv_reader.hpp"
#include "model/validation.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <string_view>
#include <vector>

namespace coreorient::io {

namespace {

/**
 * @brief Описание колонки таблицы: каноническое имя и алиасы заголовка
 */
struct ColumnDef {
    std::string name;
    std::vector<std::string> aliases;
};

using TableLayout = std::array<ColumnDef, 3>;

struct TableRow {
    size_t line = 0;
    std::array<double, 3> values{};
};

const TableLayout kSurveyColumns = {{
    {"depth", {"depth", "md", "dept", "dep", "depthm", "measureddepth", "from"}},
    {"bearing", {"bearing", "azimuth", "azi", "azim", "az", "brg"}},
    {"inclination", {"inclination", "incl", "inc"}}
}};

const TableLayout kMeasurementColumns = {{
    {"depth", {"depth", "md", "dept", "dep", "depthm", "measureddepth", "from"}},
    {"alpha", {"alpha", "alphaangle", "alfa", "a"}},
    {"beta", {"beta", "betaangle", "b"}}
}};

std::string trim(std::string_view str) {
    size_t start = 0;
    while (start < str.size() && std::isspace(static_cast<unsigned char>(str[start]))) {
        ++start;
    }
    size_t end = str.size();
    while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
        --end;
    }
    return std::string(str.substr(start, end - start));
}

std::string stripBom(std::string_view str) {
    if (str.size() >= 3 &&
        static_cast<unsigned char>(str[0]) == 0xEF &&
        static_cast<unsigned char>(str[1]) == 0xBB &&
        static_cast<unsigned char>(str[2]) == 0xBF) {
        return std::string(str.substr(3));
    }
    return std::string(str);
}

/// Нижний регистр, только буквы и цифры: "Depth (m)" -> "depthm"
std::string normalizeHeaderToken(std::string_view value) {
    std::string normalized;
    normalized.reserve(value.size());
    for (char ch : value) {
        auto c = static_cast<unsigned char>(ch);
        if (std::isalnum(c)) {
            normalized += static_cast<char>(std::tolower(c));
        }
    }
    return normalized;
}

std::vector<std::string> splitLine(std::string_view line, char delimiter) {
    std::vector<std::string> result;
    std::string current;
    bool in_quotes = false;

    for (char c : line) {
        if (c == '"') {
            in_quotes = !in_quotes;
        } else if (c == delimiter && !in_quotes) {
            result.push_back(trim(current));
            current.clear();
        } else {
            current += c;
        }
    }

    result.push_back(trim(current));
    return result;
}

double parseDouble(const std::string& str, char decimal_sep) {
    if (str.empty()) {
        return std::numeric_limits<double>::quiet_NaN();
    }

    std::string normalized = str;
    if (decimal_sep == ',') {
        std::replace(normalized.begin(), normalized.end(), ',', '.');
    }

    const char* begin = normalized.c_str();
    char* end = nullptr;
    double value = std::strtod(begin, &end);
    if (end == begin) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    // Вся строка должна быть числом
    while (*end != '\0' && std::isspace(static_cast<unsigned char>(*end))) {
        ++end;
    }
    if (*end != '\0') {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return value;
}

char detectDelimiter(const std::vector<std::string>& lines, char decimal_sep) {
    std::array<char, 4> candidates = {',', ';', '\t', '|'};

    for (char candidate : candidates) {
        if (candidate == decimal_sep) continue;

        // Разделитель должен встречаться одинаковое число раз в каждой строке
        int expected = -1;
        bool consistent = true;
        for (const auto& line : lines) {
            int count = static_cast<int>(std::count(line.begin(), line.end(), candidate));
            if (expected < 0) {
                expected = count;
            } else if (count != expected) {
                consistent = false;
                break;
            }
        }

        if (consistent && expected > 0) {
            return candidate;
        }
    }

    return decimal_sep == ',' ? ';' : ',';
}

bool looksLikeHeader(const std::vector<std::string>& fields, char decimal_sep) {
    int text_count = 0;
    int number_count = 0;

    for (const auto& field : fields) {
        if (field.empty()) continue;
        if (std::isnan(parseDouble(field, decimal_sep))) {
            ++text_count;
        } else {
            ++number_count;
        }
    }

    return text_count > number_count;
}

std::array<size_t, 3> mapColumns(
    const std::vector<std::string>& header,
    const TableLayout& layout,
    size_t header_line
) {
    std::array<size_t, 3> mapping{};

    for (size_t c = 0; c < layout.size(); ++c) {
        std::optional<size_t> found;
        for (size_t i = 0; i < header.size() && !found.has_value(); ++i) {
            const auto token = normalizeHeaderToken(header[i]);
            const auto& aliases = layout[c].aliases;
            if (std::find(aliases.begin(), aliases.end(), token) != aliases.end()) {
                found = i;
            }
        }

        if (!found.has_value()) {
            std::ostringstream oss;
            oss << "Не найдена колонка \"" << layout[c].name << "\". Найдены заголовки: ";
            for (size_t i = 0; i < header.size(); ++i) {
                if (i > 0) oss << ", ";
                oss << '"' << header[i] << '"';
            }
            throw CsvReadError(oss.str(), header_line);
        }
        mapping[c] = *found;
    }

    return mapping;
}

std::vector<TableRow> readTable(
    std::istream& input,
    const CsvReadOptions& options,
    const TableLayout& layout
) {
    std::vector<std::pair<size_t, std::string>> lines;
    std::string line;
    size_t line_num = 0;

    while (std::getline(input, line)) {
        ++line_num;
        if (line_num <= options.skip_lines) continue;

        auto cleaned = trim(stripBom(line));
        if (!cleaned.empty()) {
            lines.emplace_back(line_num, std::move(cleaned));
        }
    }

    if (lines.empty()) {
        throw CsvReadError("Файл пуст или содержит только пустые строки");
    }

    char delimiter = options.delimiter.value_or('\0');
    if (!options.delimiter.has_value()) {
        std::vector<std::string> sample;
        for (size_t i = 0; i < lines.size() && i < 50; ++i) {
            sample.push_back(lines[i].second);
        }
        delimiter = detectDelimiter(sample, options.decimal_separator);
    }

    auto first_fields = splitLine(lines.front().second, delimiter);
    const bool has_header = looksLikeHeader(first_fields, options.decimal_separator);

    std::array<size_t, 3> mapping = {0, 1, 2};
    if (has_header) {
        mapping = mapColumns(first_fields, layout, lines.front().first);
    }
    const size_t required_cols = *std::max_element(mapping.begin(), mapping.end()) + 1;

    std::vector<TableRow> rows;
    for (size_t i = has_header ? 1 : 0; i < lines.size(); ++i) {
        const auto& [num, text] = lines[i];
        auto fields = splitLine(text, delimiter);

        if (fields.size() < required_cols) {
            throw CsvReadError(
                "Недостаточно колонок: ожидается " + std::to_string(required_cols) +
                ", найдено " + std::to_string(fields.size()), num);
        }

        TableRow row;
        row.line = num;
        for (size_t c = 0; c < layout.size(); ++c) {
            const auto& field = fields[mapping[c]];
            double value = parseDouble(field, options.decimal_separator);
            if (!std::isfinite(value)) {
                throw CsvReadError(
                    "Некорректное значение " + layout[c].name + ": \"" + field + "\"", num);
            }
            row.values[c] = value;
        }
        rows.push_back(row);
    }

    if (rows.empty()) {
        throw CsvReadError("Файл не содержит данных");
    }

    return rows;
}

std::ifstream openInput(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw CsvReadError("Не удалось открыть файл: " + path.string());
    }
    return file;
}

} // anonymous namespace

SurveyStationList parseSurveyStations(std::istream& input, const CsvReadOptions& options) {
    SurveyStationList stations;

    for (const auto& row : readTable(input, options, kSurveyColumns)) {
        try {
            stations.emplace_back(
                Meters{row.values[0]},
                validateRange(Degrees{row.values[1]}, validation_limits::kMinAzimuth,
                              validation_limits::kMaxAzimuth, "bearing"),
                validateRange(Degrees{row.values[2]}, validation_limits::kMinInclination,
                              validation_limits::kMaxInclination, "inclination"));
        } catch (const OutOfRangeError& e) {
            throw CsvReadError(e.what(), row.line);
        }
    }

    return stations;
}

SurveyStationList readSurveyStations(const std::filesystem::path& path, const CsvReadOptions& options) {
    auto file = openInput(path);
    return parseSurveyStations(file, options);
}

RawMeasurementList parseRawMeasurements(std::istream& input, const CsvReadOptions& options) {
    RawMeasurementList measurements;

    for (const auto& row : readTable(input, options, kMeasurementColumns)) {
        try {
            measurements.emplace_back(
                Meters{validateRange(row.values[0], validation_limits::kMinDepth,
                                     std::numeric_limits<double>::max(), "depth")},
                validateRange(Degrees{row.values[1]}, validation_limits::kMinAcute,
                              validation_limits::kMaxAcute, "alpha"),
                validateRange(Degrees{row.values[2]}, validation_limits::kMinAzimuth,
                              validation_limits::kMaxAzimuth, "beta"));
        } catch (const OutOfRangeError& e) {
            throw CsvReadError(e.what(), row.line);
        }
    }

    return measurements;
}

RawMeasurementList readRawMeasurements(const std::filesystem::path& path, const CsvReadOptions& options) {
    auto file = openInput(path);
    return parseRawMeasurements(file, options);
}

} // namespace coreorient::io
