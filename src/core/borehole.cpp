/**
 * @file borehole.cpp
 * @brief Реализация пересчёта замеров скважины
 */

#include "borehole.hpp"
#include "orient.hpp"
#include <sstream>

namespace coreorient::core {

namespace {

std::string depthOutOfRangeMessage(Meters depth, size_t index) {
    std::ostringstream oss;
    oss << "Замер " << (index + 1) << ": глубина " << depth.value
        << " м вне интервала станций инклинометрии";
    return oss.str();
}

void validateStationAngles(const SurveyStationList& stations) {
    for (const auto& st : stations) {
        validateRange(st.bearing, validation_limits::kMinAzimuth,
                      validation_limits::kMaxAzimuth, "bearing");
        validateRange(st.inclination, validation_limits::kMinInclination,
                      validation_limits::kMaxInclination, "inclination");
    }
}

} // namespace

DepthOutOfSurveyRangeError::DepthOutOfSurveyRangeError(Meters depth, size_t measurement_index)
    : std::runtime_error(depthOutOfRangeMessage(depth, measurement_index))
    , depth_(depth)
    , measurement_index_(measurement_index) {}

OrientedMeasurements orientMeasurements(
    const RawMeasurementList& measurements,
    const SurveyStationList& stations,
    ReferenceLine line
) {
    auto report = validateSurveyStations(stations);
    if (report.hasErrors()) {
        throw InvalidSurveyDataError(std::move(report));
    }
    validateStationAngles(stations);

    const auto intervals = buildDepthIntervals(stations);

    OrientedMeasurements result;
    result.planes.reserve(measurements.size());
    result.station_index.reserve(measurements.size());

    for (size_t i = 0; i < measurements.size(); ++i) {
        const auto& m = measurements[i];

        auto index = findStationIndex(intervals, m.depth);
        if (!index.has_value()) {
            throw DepthOutOfSurveyRangeError(m.depth, i);
        }

        const auto& station = stations[*index];
        result.planes.push_back(
            Orient(station.bearing, station.inclination, m.alpha, m.beta, line).toPlane());
        result.station_index.push_back(*index);
    }

    return result;
}

Borehole::Borehole(ReferenceLine line,
                   const RawMeasurementList& measurements,
                   SurveyStationList stations)
    : reference_line_(line)
    , stations_(std::move(stations))
    , result_(orientMeasurements(measurements, stations_, reference_line_)) {}

} // namespace coreorient::core
