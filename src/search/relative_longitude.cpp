/// @file relative_longitude.cpp
/// @brief Implementation of the relative-longitude search.

#include "search/relative_longitude.hpp"

#include "astro/coordinates.hpp"
#include "astro/solar_geometry.hpp"
#include "core/error.hpp"
#include "core/logger.hpp"

#include <cmath>

namespace almanac::search
{

using ephemeris::Body;

f64 RelativeLongitudeSearch::offset(Body body, const astro::Instant& time,
                                    f64 direction, f64 target_rel_lon)
{
    const f64 plon = astro::SolarGeometry::ecliptic_longitude(body, time);
    const f64 elon = astro::SolarGeometry::ecliptic_longitude(Body::Earth, time);
    return astro::Coordinates::longitude_offset(direction * (elon - plon) - target_rel_lon);
}

// -----------------------------------------------------------------
// Secant-style iteration on the synodic period:
//   t += (-error / 360) * S
// For eccentric orbits S is rescaled by the observed ratio
// prev / (prev - error) once the error is below 30 degrees.
// -----------------------------------------------------------------

astro::Instant RelativeLongitudeSearch::search(
    Body body,
    f64 target_rel_lon,
    const astro::Instant& start)
{
    if (body == Body::Earth)
    {
        ALM_ERROR("RelativeLongitudeSearch: the Earth has no relative longitude to itself");
        throw core::EarthNotAllowedError();
    }
    if (body == Body::Moon || body == Body::Sun)
    {
        ALM_ERROR("RelativeLongitudeSearch: {} does not orbit the Sun independently",
                  ephemeris::body_name(body));
        throw core::InvalidBodyError();
    }

    constexpr i32 kMaxIterations = 100;

    f64 syn = ephemeris::Bodies::synodic_period(body);
    const f64 direction = ephemeris::Bodies::is_superior_planet(body) ? +1.0 : -1.0;

    // Error is made negative so the search always runs forward in time
    f64 error_angle = offset(body, start, direction, target_rel_lon);
    if (error_angle > 0.0)
    {
        error_angle -= 360.0;
    }

    astro::Instant time = start;
    for (i32 iter = 0; iter < kMaxIterations; ++iter)
    {
        const f64 day_adjust = (-error_angle / 360.0) * syn;
        time = time.add_days(day_adjust);
        if (std::abs(day_adjust) * astro_constants::kSecondsPerDay < 1.0)
        {
            ALM_TRACE("RelativeLongitudeSearch: {} reached {} deg after {} iterations",
                      ephemeris::body_name(body), target_rel_lon, iter + 1);
            return time;
        }

        const f64 prev_angle = error_angle;
        error_angle = offset(body, time, direction, target_rel_lon);
        if (std::abs(prev_angle) < 30.0 && prev_angle != error_angle)
        {
            const f64 ratio = prev_angle / (prev_angle - error_angle);
            if (ratio > 0.5 && ratio < 2.0)
            {
                syn *= ratio;
            }
        }
    }

    ALM_ERROR("RelativeLongitudeSearch: {} did not converge", ephemeris::body_name(body));
    throw core::NoConvergeError("Relative longitude search did not converge");
}

} // namespace almanac::search
