/**
 * @file csv_writer.cpp
 * @brief Реализация экспорта плоскостей в CSV
 * @author Yan Bubenok <yan@bubenok.com>
 */

#include "csv_writer.hpp"
#include "file_utils.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace coreorient::io {

namespace {

std::string formatDouble(double value, int precision, char decimal_sep) {
    if (std::isnan(value)) {
        return "";
    }

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    std::string result = ss.str();

    if (decimal_sep != '.') {
        for (char& c : result) {
            if (c == '.') c = decimal_sep;
        }
    }

    return result;
}

double fieldValue(ExportField field, const Plane& plane, Meters depth) noexcept {
    switch (field) {
        case ExportField::Depth: return depth.value;
        case ExportField::Strike: return plane.strike().value;
        case ExportField::Dip: return plane.dip().value;
        case ExportField::DipDirection: return plane.dipDirection().value;
        case ExportField::Trend: return plane.pole().trend.value;
        case ExportField::Plunge: return plane.pole().plunge.value;
    }
    return 0.0;
}

} // anonymous namespace

std::string_view getFieldName(ExportField field) noexcept {
    switch (field) {
        case ExportField::Depth: return "depth";
        case ExportField::Strike: return "strike";
        case ExportField::Dip: return "dip";
        case ExportField::DipDirection: return "dip_direction";
        case ExportField::Trend: return "trend";
        case ExportField::Plunge: return "plunge";
    }
    return "";
}

std::vector<ExportField> getExportFields(bool include_depth) {
    std::vector<ExportField> fields;
    if (include_depth) {
        fields.push_back(ExportField::Depth);
    }
    fields.insert(fields.end(), {
        ExportField::Strike,
        ExportField::Dip,
        ExportField::DipDirection,
        ExportField::Trend,
        ExportField::Plunge
    });
    return fields;
}

CsvExportOptions exportOptionsFromSettings(const OrientationSettings& settings) noexcept {
    CsvExportOptions options;
    options.delimiter = settings.csv_delimiter;
    options.decimal_separator = settings.csv_decimal_separator;
    options.decimal_places = settings.csv_decimal_places;
    options.include_depth = settings.csv_include_depth;
    return options;
}

std::string formatPlanesCsv(
    const PlaneList& planes,
    const std::vector<Meters>& depths,
    const CsvExportOptions& options
) {
    if (options.include_depth && depths.size() != planes.size()) {
        throw CsvWriteError(
            "Число глубин (" + std::to_string(depths.size()) +
            ") не совпадает с числом плоскостей (" + std::to_string(planes.size()) + ")");
    }
    if (options.delimiter == options.decimal_separator) {
        throw CsvWriteError("Разделитель полей совпадает с десятичным разделителем");
    }

    const auto fields = getExportFields(options.include_depth);
    std::ostringstream out;

    if (options.include_header) {
        for (size_t i = 0; i < fields.size(); ++i) {
            if (i > 0) out << options.delimiter;
            out << getFieldName(fields[i]);
        }
        out << "\n";
    }

    for (size_t row = 0; row < planes.size(); ++row) {
        const Meters depth = options.include_depth ? depths[row] : Meters{0.0};
        for (size_t i = 0; i < fields.size(); ++i) {
            if (i > 0) out << options.delimiter;
            out << formatDouble(fieldValue(fields[i], planes[row], depth),
                                options.decimal_places, options.decimal_separator);
        }
        out << "\n";
    }

    return out.str();
}

void writeCsvPlanes(
    const PlaneList& planes,
    const std::filesystem::path& path,
    const CsvExportOptions& options,
    const std::vector<Meters>& depths
) {
    const auto content = formatPlanesCsv(planes, depths, options);

    try {
        atomicWrite(path, content);
    } catch (const std::exception& e) {
        throw CsvWriteError(e.what());
    }
}

} // namespace coreorient::io
