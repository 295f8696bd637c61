/**
 * @file angle_utils.cpp
 * @brief Реализация связей между углами плоскости
 * @author Yan Bubenok <yan@bubenok.com>
 */

#include "angle_utils.hpp"
#include "model/validation.hpp"

namespace coreorient::core {

Degrees clockwiseFromInput(
    Degrees input,
    Degrees add,
    double min,
    double max,
    const std::string& field
) {
    validateRange(input, min, max, field);

    double output = input.value + add.value;
    if (output >= max) {
        output -= max;
    }
    return Degrees{output};
}

Degrees dipDirectionFromStrike(Degrees strike) {
    return clockwiseFromInput(strike, Degrees{90.0},
        validation_limits::kMinAzimuth, validation_limits::kMaxAzimuth, "strike");
}

Degrees trendFromStrike(Degrees strike) {
    return clockwiseFromInput(strike, Degrees{270.0},
        validation_limits::kMinAzimuth, validation_limits::kMaxAzimuth, "strike");
}

Degrees strikeFromTrend(Degrees trend) {
    return clockwiseFromInput(trend, Degrees{90.0},
        validation_limits::kMinAzimuth, validation_limits::kMaxAzimuth, "trend");
}

Degrees perpendicularAngle(Degrees angle, const std::string& field) {
    validateRange(angle, validation_limits::kMinAcute, validation_limits::kMaxAcute, field);
    return Degrees{90.0 - angle.value};
}

Degrees plungeFromDip(Degrees dip) {
    return perpendicularAngle(dip, "dip");
}

Degrees dipFromPlunge(Degrees plunge) {
    return perpendicularAngle(plunge, "plunge");
}

} // namespace coreorient::core
