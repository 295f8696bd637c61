/**
 * @file cli.cpp
 * @brief Реализация командной строки
 */

#include "cli.hpp"
#include "core/borehole.hpp"
#include "core/orient.hpp"
#include "io/csv_reader.hpp"
#include "io/csv_writer.hpp"
#include "io/plane_json.hpp"
#include "io/settings_io.hpp"
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <optional>
#include <sstream>

namespace coreorient::app {

namespace {

using namespace coreorient::model;

/**
 * @brief Последовательный разбор аргументов команды
 */
class ArgCursor {
public:
    ArgCursor(const std::vector<std::string>& args, size_t start)
        : args_(args), pos_(start) {}

    [[nodiscard]] bool done() const noexcept { return pos_ >= args_.size(); }

    const std::string& next() { return args_[pos_++]; }

    std::string value(const std::string& option) {
        if (done()) {
            throw UsageError("Не указано значение для " + option);
        }
        return next();
    }

    double number(const std::string& option) {
        const auto text = value(option);
        const char* begin = text.c_str();
        char* end = nullptr;
        double result = std::strtod(begin, &end);
        if (end == begin || *end != '\0' || !std::isfinite(result)) {
            throw UsageError("Некорректное число для " + option + ": \"" + text + "\"");
        }
        return result;
    }

    int integer(const std::string& option, long min, long max) {
        const auto text = value(option);
        const char* begin = text.c_str();
        char* end = nullptr;
        long result = std::strtol(begin, &end, 10);
        if (end == begin || *end != '\0' || result < min || result > max) {
            throw UsageError("Некорректное значение для " + option + ": \"" + text +
                             "\" (ожидается целое от " + std::to_string(min) +
                             " до " + std::to_string(max) + ")");
        }
        return static_cast<int>(result);
    }

    /// Один символ или имя: tab, comma, semicolon, pipe
    char character(const std::string& option) {
        const auto text = value(option);
        if (text == "tab") return '\t';
        if (text == "comma") return ',';
        if (text == "semicolon") return ';';
        if (text == "pipe") return '|';
        if (text.size() != 1) {
            throw UsageError("Ожидается один символ для " + option + ": \"" + text + "\"");
        }
        return text.front();
    }

private:
    const std::vector<std::string>& args_;
    size_t pos_;
};

ReferenceLine referenceLineArg(const std::string& text) {
    try {
        return parseReferenceLine(text);
    } catch (const std::invalid_argument& e) {
        throw UsageError(e.what());
    }
}

void printPlane(std::ostream& out, const Plane& plane) {
    std::ostringstream text;
    text << std::fixed << std::setprecision(2)
        << "strike: " << plane.strike().value << "\n"
        << "dip: " << plane.dip().value << "\n"
        << "dip_direction: " << plane.dipDirection().value << "\n"
        << "trend: " << plane.pole().trend.value << "\n"
        << "plunge: " << plane.pole().plunge.value << "\n";
    out << text.str();
}

int runOrientOne(const std::vector<std::string>& args, std::ostream& out) {
    std::optional<double> bearing;
    std::optional<double> inclination;
    std::optional<double> alpha;
    std::optional<double> beta;
    ReferenceLine line = ReferenceLine::Top;
    bool as_json = false;

    ArgCursor cursor(args, 1);
    while (!cursor.done()) {
        const auto arg = cursor.next();
        if (arg == "--bearing") {
            bearing = cursor.number(arg);
        } else if (arg == "--inclination") {
            inclination = cursor.number(arg);
        } else if (arg == "--alpha") {
            alpha = cursor.number(arg);
        } else if (arg == "--beta") {
            beta = cursor.number(arg);
        } else if (arg == "--bottom") {
            line = ReferenceLine::Bottom;
        } else if (arg == "--reference-line") {
            line = referenceLineArg(cursor.value(arg));
        } else if (arg == "--json") {
            as_json = true;
        } else {
            throw UsageError("Неизвестный параметр: " + arg);
        }
    }

    if (!bearing || !inclination || !alpha || !beta) {
        throw UsageError("Для orient-one нужны --bearing, --inclination, --alpha и --beta");
    }

    // Во входных данных наклон положителен вниз, в расчёте вниз отрицателен
    const auto plane = core::Orient(
        Degrees{*bearing}, Degrees{-*inclination},
        Degrees{*alpha}, Degrees{*beta}, line).toPlane();

    if (as_json) {
        out << io::planeToJson(plane).dump(2) << "\n";
    } else {
        printPlane(out, plane);
    }
    return kExitOk;
}

struct BoreholeArgs {
    std::filesystem::path survey;
    std::filesystem::path measurements;
    std::optional<std::filesystem::path> output;
    std::optional<std::filesystem::path> json;
    std::optional<std::filesystem::path> config;
    std::optional<ReferenceLine> reference_line;
    std::optional<int> precision;
    bool with_depth = false;
    io::CsvReadOptions input;
};

BoreholeArgs parseBoreholeArgs(const std::vector<std::string>& args) {
    BoreholeArgs parsed;

    ArgCursor cursor(args, 1);
    while (!cursor.done()) {
        const auto arg = cursor.next();
        if (arg == "--survey") {
            parsed.survey = cursor.value(arg);
        } else if (arg == "--measurements") {
            parsed.measurements = cursor.value(arg);
        } else if (arg == "--output") {
            parsed.output = cursor.value(arg);
        } else if (arg == "--json") {
            parsed.json = cursor.value(arg);
        } else if (arg == "--config") {
            parsed.config = cursor.value(arg);
        } else if (arg == "--bottom") {
            parsed.reference_line = ReferenceLine::Bottom;
        } else if (arg == "--reference-line") {
            parsed.reference_line = referenceLineArg(cursor.value(arg));
        } else if (arg == "--precision") {
            parsed.precision = cursor.integer(arg, 0, 12);
        } else if (arg == "--with-depth") {
            parsed.with_depth = true;
        } else if (arg == "--input-delimiter") {
            parsed.input.delimiter = cursor.character(arg);
        } else if (arg == "--input-decimal") {
            parsed.input.decimal_separator = cursor.character(arg);
        } else if (arg == "--skip-lines") {
            parsed.input.skip_lines = static_cast<size_t>(cursor.integer(arg, 0, 1000));
        } else {
            throw UsageError("Неизвестный параметр: " + arg);
        }
    }

    if (parsed.survey.empty() || parsed.measurements.empty()) {
        throw UsageError("Для borehole нужны --survey и --measurements");
    }
    if (parsed.input.delimiter == parsed.input.decimal_separator) {
        throw UsageError("Разделитель полей совпадает с десятичным разделителем");
    }
    return parsed;
}

int runBorehole(const std::vector<std::string>& args, std::ostream& out) {
    const auto parsed = parseBoreholeArgs(args);

    OrientationSettings settings;
    if (parsed.config) {
        settings = io::loadSettings(*parsed.config);
    }
    if (parsed.reference_line) {
        settings.reference_line = *parsed.reference_line;
    }
    if (parsed.precision) {
        settings.csv_decimal_places = *parsed.precision;
    }
    if (parsed.with_depth) {
        settings.csv_include_depth = true;
    }

    auto stations = io::readSurveyStations(parsed.survey, parsed.input);
    const auto measurements = io::readRawMeasurements(parsed.measurements, parsed.input);
    const size_t station_count = stations.size();

    core::Borehole borehole(settings.reference_line, measurements, std::move(stations));

    std::vector<Meters> depths;
    depths.reserve(measurements.size());
    for (const auto& m : measurements) {
        depths.push_back(m.depth);
    }

    const auto options = io::exportOptionsFromSettings(settings);

    if (parsed.output) {
        io::writeCsvPlanes(borehole.orientedMeasurements(), *parsed.output, options, depths);
        out << "Станций: " << station_count << ", замеров: " << measurements.size() << "\n";
        out << "Результат сохранён: " << parsed.output->string() << "\n";
    } else {
        out << io::formatPlanesCsv(borehole.orientedMeasurements(), depths, options);
    }

    if (parsed.json) {
        io::writeJsonReport(*parsed.json, io::boreholeReportToJson(borehole, measurements));
        if (parsed.output) {
            out << "Отчёт JSON сохранён: " << parsed.json->string() << "\n";
        }
    }

    return kExitOk;
}

} // anonymous namespace

std::string usageText() {
    return
        "Использование:\n"
        "  coreorient orient-one --bearing B --inclination I --alpha A --beta C\n"
        "                        [--bottom | --reference-line top|bottom] [--json]\n"
        "  coreorient borehole --survey <csv> --measurements <csv>\n"
        "                      [--output <csv>] [--json <файл>] [--config <json>]\n"
        "                      [--bottom | --reference-line top|bottom]\n"
        "                      [--precision N] [--with-depth]\n"
        "                      [--input-delimiter C] [--input-decimal C] [--skip-lines N]\n"
        "  coreorient --help\n"
        "\n"
        "Углы в градусах. Наклон ствола (--inclination) положителен вниз.\n";
}

int runCli(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    if (args.empty()) {
        err << usageText();
        return kExitUsage;
    }

    const auto& command = args.front();
    if (command == "--help" || command == "-h" || command == "help") {
        out << usageText();
        return kExitOk;
    }

    try {
        if (command == "orient-one") {
            return runOrientOne(args, out);
        }
        if (command == "borehole") {
            return runBorehole(args, out);
        }
        throw UsageError("Неизвестная команда: " + command);
    } catch (const UsageError& e) {
        err << "Ошибка: " << e.what() << "\n\n" << usageText();
        return kExitUsage;
    } catch (const std::exception& e) {
        err << "Ошибка: " << e.what() << "\n";
        return kExitFailure;
    }
}

} // namespace coreorient::app
