/// @file solar_geometry.cpp
/// @brief Implementation of Sun-relative geometry.

#include "astro/solar_geometry.hpp"

#include "astro/earth_orientation.hpp"
#include "astro/frames.hpp"
#include "astro/light_time.hpp"
#include "core/error.hpp"
#include "core/logger.hpp"
#include "ephemeris/ephemeris.hpp"

namespace almanac::astro
{

using ephemeris::Body;

EclipticCoord SolarGeometry::sun_position(const Instant& time)
{
    // Without the light-time shift equinoxes and solstices come out about 8 minutes early
    const Instant adjusted = time.add_days(-1.0 / astro_constants::kSpeedOfLightAuPerDay);
    const Vec3d sun2000 = -ephemeris::Ephemeris::earth(adjusted).pos;

    const Vec3d mean_of_date = Frames::precess(0.0, sun2000, adjusted.tt());
    const Vec3d true_of_date = Frames::nutate(adjusted, NutationDirection::MeanToTrue, mean_of_date);

    const f64 true_obliquity = adjusted.tilt().true_obliquity * astro_constants::kDegToRad;
    return Coordinates::rotate_equatorial_to_ecliptic(true_of_date, true_obliquity);
}

f64 SolarGeometry::ecliptic_longitude(Body body, const Instant& time)
{
    if (body == Body::Sun)
    {
        ALM_CORE_ERROR("SolarGeometry: heliocentric longitude of the Sun is undefined");
        throw core::InvalidBodyError("The Sun has no heliocentric longitude");
    }

    const AstroVector hv = ephemeris::Ephemeris::helio_vector(body, time);
    return Coordinates::ecliptic(hv.pos).elon;
}

f64 SolarGeometry::angle_from_sun(Body body, const Instant& time)
{
    if (body == Body::Earth)
    {
        ALM_CORE_ERROR("SolarGeometry: angle from the Sun requested for the Earth");
        throw core::EarthNotAllowedError();
    }

    const AstroVector sv = LightTime::geo_vector(Body::Sun, time, true);
    const AstroVector bv = LightTime::geo_vector(body, time, true);
    return Coordinates::angle_between(sv.pos, bv.pos);
}

f64 SolarGeometry::longitude_from_sun(Body body, const Instant& time)
{
    if (body == Body::Earth)
    {
        ALM_CORE_ERROR("SolarGeometry: longitude from the Sun requested for the Earth");
        throw core::EarthNotAllowedError();
    }

    const EclipticCoord se = Coordinates::ecliptic(LightTime::geo_vector(Body::Sun, time, true).pos);
    const EclipticCoord be = Coordinates::ecliptic(LightTime::geo_vector(body, time, true).pos);
    return Coordinates::normalize_longitude(be.elon - se.elon);
}

ElongationEvent SolarGeometry::elongation(Body body, const Instant& time)
{
    const f64 angle = longitude_from_sun(body, time);
    const bool morning = angle > 180.0;

    return ElongationEvent{
        .time                = time,
        .visibility          = morning ? Visibility::Morning : Visibility::Evening,
        .elongation          = angle_from_sun(body, time),
        .ecliptic_separation = morning ? 360.0 - angle : angle,
    };
}

f64 SolarGeometry::moon_phase(const Instant& time)
{
    return longitude_from_sun(Body::Moon, time);
}

} // namespace almanac::astro
