/**
 * @file plane.cpp
 * @brief Реализация ориентированной плоскости
 */

#include "plane.hpp"
#include "validation.hpp"
#include "core/angle_utils.hpp"
#include "core/orient.hpp"

namespace coreorient::model {

Lineation::Lineation(Degrees trend_, Degrees plunge_)
    : trend(validateRange(trend_, validation_limits::kMinAzimuth, validation_limits::kMaxAzimuth, "trend"))
    , plunge(validateRange(plunge_, validation_limits::kMinAcute, validation_limits::kMaxAcute, "plunge")) {}

Plane::Plane(Degrees strike,
             Degrees dip,
             OptionalAngle dip_direction,
             OptionalAngle trend,
             OptionalAngle plunge)
    : strike_(validateRange(strike, validation_limits::kMinAzimuth, validation_limits::kMaxAzimuth, "strike"))
    , dip_(validateRange(dip, validation_limits::kMinAcute, validation_limits::kMaxAcute, "dip")) {
    dip_direction_ = validateRange(
        dip_direction.value_or(core::dipDirectionFromStrike(strike_)),
        validation_limits::kMinAzimuth, validation_limits::kMaxAzimuth, "dip_direction");

    pole_ = Lineation{
        trend.value_or(core::trendFromStrike(strike_)),
        plunge.value_or(core::plungeFromDip(dip_))
    };
}

Plane Plane::alphaBeta(
    Degrees bearing,
    Degrees inclination,
    Degrees alpha,
    Degrees beta,
    ReferenceLine line
) {
    return core::Orient(bearing, inclination, alpha, beta, line).toPlane();
}

} // namespace coreorient::model
