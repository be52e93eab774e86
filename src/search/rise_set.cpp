/// @file rise_set.cpp
/// @brief Implementation of the rise/set search.

#include "search/rise_set.hpp"

#include "astro/coordinates.hpp"
#include "astro/light_time.hpp"
#include "core/error.hpp"
#include "core/logger.hpp"
#include "search/hour_angle.hpp"
#include "search/root_finder.hpp"

namespace almanac::search
{

using ephemeris::Body;

namespace
{
    /// @brief Altitude of the top of the body, positive above the horizon for
    /// Rise and positive below it for Set.
    ///
    /// Airless altitude plus the angular radius plus a fixed near-horizon
    /// refraction, so a full refraction model is not needed inside the search.
    f64 peak_altitude(Body body, const astro::GeoLocation& observer, f64 direction,
                      f64 body_radius_au, const astro::Instant& time)
    {
        const astro::EquatorialCoord ofdate = astro::LightTime::equator(
            body, time, observer, astro::EquatorEpoch::OfDate, true);
        const astro::HorizontalCoord hor = astro::Coordinates::horizon(
            time, observer, ofdate.ra, ofdate.dec, astro::Refraction::Airless);

        const f64 alt = hor.altitude + (body_radius_au / ofdate.dist) * astro_constants::kRadToDeg;
        return direction * (alt + astro_constants::kRefractionNearHorizon);
    }
}

std::optional<astro::Instant> RiseSetSearch::search(
    Body body,
    const astro::GeoLocation& observer,
    Direction direction,
    const astro::Instant& start,
    f64 limit_days)
{
    f64 body_radius = 0.0;
    switch (body)
    {
        case Body::Earth:
            ALM_ERROR("RiseSetSearch: the Earth does not rise or set");
            throw core::EarthNotAllowedError();
        case Body::Sun:
            body_radius = astro_constants::kSunRadiusAu;
            break;
        case Body::Moon:
            body_radius = astro_constants::kMoonRadiusAu;
            break;
        default:
            break;
    }

    // Rise: lowest point (ha 12) comes before, culmination (ha 0) after.
    // Set is the mirror image.
    const f64 ha_before = (direction == Direction::Rise) ? 12.0 : 0.0;
    const f64 ha_after = (direction == Direction::Rise) ? 0.0 : 12.0;
    const f64 sign = (direction == Direction::Rise) ? +1.0 : -1.0;

    const SearchFunction altitude = [&](const astro::Instant& t)
    {
        return peak_altitude(body, observer, sign, body_radius, t);
    };

    astro::Instant time_before = start;
    f64 alt_before = altitude(start);
    if (alt_before > 0.0)
    {
        // Already past the event: wait for the next lower/upper culmination
        const HourAngleEvent evt_before = HourAngleSearch::search(body, observer, ha_before, start);
        time_before = evt_before.time;
        alt_before = altitude(time_before);
    }

    HourAngleEvent evt_after = HourAngleSearch::search(body, observer, ha_after, time_before);
    f64 alt_after = altitude(evt_after.time);

    for (;;)
    {
        if (alt_before <= 0.0 && alt_after > 0.0)
        {
            if (const auto event_time = RootFinder::search(altitude, time_before, evt_after.time, 1.0))
            {
                ALM_DEBUG("RiseSetSearch: {} {} at UT {}", ephemeris::body_name(body),
                          direction == Direction::Rise ? "rises" : "sets", event_time->ut());
                return event_time;
            }
        }

        const HourAngleEvent evt_before = HourAngleSearch::search(body, observer, ha_before, evt_after.time);
        evt_after = HourAngleSearch::search(body, observer, ha_after, evt_before.time);

        if (evt_before.time.ut() >= start.ut() + limit_days)
        {
            ALM_DEBUG("RiseSetSearch: no {} of {} within {} days",
                      direction == Direction::Rise ? "rise" : "set", ephemeris::body_name(body), limit_days);
            return std::nullopt;
        }

        time_before = evt_before.time;
        alt_before = altitude(evt_before.time);
        alt_after = altitude(evt_after.time);
    }
}

} // namespace almanac::search
