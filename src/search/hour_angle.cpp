/// @file hour_angle.cpp
/// @brief Implementation of the hour-angle search.

#include "search/hour_angle.hpp"

#include "astro/earth_orientation.hpp"
#include "astro/light_time.hpp"
#include "core/error.hpp"
#include "core/logger.hpp"

#include <cmath>
#include <stdexcept>

namespace almanac::search
{

// -----------------------------------------------------------------
// Iteration on sidereal time:
//   delta = (ha + ra - lon/15 - GAST) mod 24   [sidereal hours]
//   t += delta / 24 * (solar days per sidereal day)
// -----------------------------------------------------------------

HourAngleEvent HourAngleSearch::search(
    ephemeris::Body body,
    const astro::GeoLocation& observer,
    f64 hour_angle,
    const astro::Instant& start)
{
    if (body == ephemeris::Body::Earth)
    {
        ALM_ERROR("HourAngleSearch: the Earth has no hour angle");
        throw core::EarthNotAllowedError();
    }

    if (hour_angle < 0.0 || hour_angle >= 24.0)
    {
        ALM_ERROR("HourAngleSearch: invalid hour angle {}", hour_angle);
        throw std::invalid_argument("Hour angle must be in the range [0, 24)");
    }

    astro::Instant time = start;
    for (i32 iter = 1;; ++iter)
    {
        const f64 gast = astro::EarthOrientation::sidereal_time(time);
        const astro::EquatorialCoord ofdate = astro::LightTime::equator(
            body, time, observer, astro::EquatorEpoch::OfDate, true);

        f64 delta_sidereal_hours = std::fmod(
            (hour_angle + ofdate.ra - observer.longitude_deg / 15.0) - gast, 24.0);

        if (iter == 1)
        {
            // Always search forward first
            if (delta_sidereal_hours < 0.0)
            {
                delta_sidereal_hours += 24.0;
            }
        }
        else
        {
            if (delta_sidereal_hours < -12.0)
            {
                delta_sidereal_hours += 24.0;
            }
            else if (delta_sidereal_hours > +12.0)
            {
                delta_sidereal_hours -= 24.0;
            }
        }

        if (std::abs(delta_sidereal_hours) * 3600.0 < 0.1)
        {
            ALM_TRACE("HourAngleSearch: {} at hour angle {} after {} iterations",
                      ephemeris::body_name(body), hour_angle, iter);
            return HourAngleEvent{
                .time = time,
                .hor  = astro::Coordinates::horizon(time, observer, ofdate.ra, ofdate.dec,
                                                    astro::Refraction::Normal),
            };
        }

        const f64 delta_days = (delta_sidereal_hours / 24.0) * astro_constants::kSolarDaysPerSiderealDay;
        time = time.add_days(delta_days);
    }
}

} // namespace almanac::search
