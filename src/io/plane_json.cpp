/**
 * @file plane_json.cpp
 * @brief Реализация JSON-представления плоскостей
 */

#include "plane_json.hpp"
#include "file_utils.hpp"

namespace coreorient::io {

using json = nlohmann::json;

namespace {

json degreesToJson(Degrees d) {
    return d.value;
}

Degrees degreesFromJson(const json& j) {
    return Degrees{j.get<double>()};
}

OptionalAngle optionalAngleFromJson(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return degreesFromJson(j[key]);
}

json stationToJson(const SurveyStation& st) {
    json j;
    j["depth"] = st.depth.value;
    j["bearing"] = degreesToJson(st.bearing);
    j["inclination"] = degreesToJson(st.inclination);
    return j;
}

} // anonymous namespace

json planeToJson(const Plane& plane) {
    json j;
    j["strike"] = degreesToJson(plane.strike());
    j["dip"] = degreesToJson(plane.dip());
    j["dip_direction"] = degreesToJson(plane.dipDirection());
    j["trend"] = degreesToJson(plane.pole().trend);
    j["plunge"] = degreesToJson(plane.pole().plunge);
    return j;
}

Plane planeFromJson(const json& j) {
    if (!j.is_object() || !j.contains("strike") || !j.contains("dip")) {
        throw ReportError("Плоскость должна содержать поля strike и dip");
    }

    try {
        return Plane(
            degreesFromJson(j["strike"]),
            degreesFromJson(j["dip"]),
            optionalAngleFromJson(j, "dip_direction"),
            optionalAngleFromJson(j, "trend"),
            optionalAngleFromJson(j, "plunge"));
    } catch (const json::type_error& e) {
        throw ReportError("Некорректный тип поля плоскости: " + std::string(e.what()));
    }
}

json boreholeReportToJson(
    const core::Borehole& borehole,
    const RawMeasurementList& measurements
) {
    const auto& planes = borehole.orientedMeasurements();
    const auto& assignments = borehole.stationAssignments();

    if (measurements.size() != planes.size()) {
        throw ReportError(
            "Число замеров (" + std::to_string(measurements.size()) +
            ") не совпадает с числом плоскостей (" + std::to_string(planes.size()) + ")");
    }

    json j;
    j["reference_line"] = toString(borehole.referenceLine());

    j["stations"] = json::array();
    for (const auto& st : borehole.stations()) {
        j["stations"].push_back(stationToJson(st));
    }

    j["planes"] = json::array();
    for (size_t i = 0; i < planes.size(); ++i) {
        json p = planeToJson(planes[i]);
        p["depth"] = measurements[i].depth.value;
        p["station_index"] = assignments[i];
        j["planes"].push_back(std::move(p));
    }

    return j;
}

void writeJsonReport(const std::filesystem::path& path, const json& report, int indent) {
    try {
        atomicWrite(path, report.dump(indent) + "\n");
    } catch (const std::exception& e) {
        throw ReportError("Ошибка сохранения отчёта: " + std::string(e.what()));
    }
}

} // namespace coreorient::io
