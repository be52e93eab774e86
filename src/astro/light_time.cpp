/// @file light_time.cpp
/// @brief Implementation of the light-time solver.

#include "astro/light_time.hpp"

#include "astro/frames.hpp"
#include "core/error.hpp"
#include "core/logger.hpp"
#include "ephemeris/ephemeris.hpp"
#include "ephemeris/lunar_theory.hpp"

#include <cmath>

namespace almanac::astro
{

// -----------------------------------------------------------------
// Light-time iteration
//
// t_0 = t
// t_(k+1) = t - |helio(body, t_k) - helio(earth, t_e)| / c
// until |t_(k+1) - t_k| < 1e-9 day (about 86 microseconds).
// t_e = t_k with aberration, t otherwise.
// -----------------------------------------------------------------

AstroVector LightTime::geo_vector(ephemeris::Body body, const Instant& time, bool aberration)
{
    using ephemeris::Body;
    using ephemeris::Ephemeris;

    if (body == Body::Moon)
    {
        return ephemeris::LunarTheory::geo_moon(time);
    }

    if (body == Body::Earth)
    {
        return AstroVector{.pos = Vec3d(0.0), .time = time};
    }

    constexpr i32 kMaxIterations = 10;

    // Without aberration the Earth stays at the observation time
    Vec3d earth = aberration ? Vec3d(0.0) : Ephemeris::earth(time).pos;

    Instant ltime = time;
    f64 dt = 0.0;
    for (i32 iter = 0; iter < kMaxIterations; ++iter)
    {
        const AstroVector helio = Ephemeris::helio_vector(body, ltime);
        if (aberration)
        {
            earth = Ephemeris::earth(ltime).pos;
        }

        const AstroVector geo{.pos = helio.pos - earth, .time = time};
        if (body == Body::Sun)
        {
            return geo;
        }

        const Instant ltime2 = time.add_days(-geo.length() / astro_constants::kSpeedOfLightAuPerDay);
        dt = std::abs(ltime2.tt() - ltime.tt());
        if (dt < 1.0e-9)
        {
            return geo;
        }

        ltime = ltime2;
    }

    ALM_CORE_ERROR("LightTime: solver did not converge for {} (dt={})", ephemeris::body_name(body), dt);
    throw core::NoConvergeError("Light-travel time solver did not converge");
}

EquatorialCoord LightTime::equator(
    ephemeris::Body body,
    const Instant& time,
    const GeoLocation& observer,
    EquatorEpoch epoch,
    bool aberration)
{
    const Vec3d observer_pos = Frames::observer_position(time, observer);
    const AstroVector geo = geo_vector(body, time, aberration);
    const Vec3d j2000 = geo.pos - observer_pos;

    if (epoch == EquatorEpoch::J2000)
    {
        return Coordinates::vector_to_equatorial(j2000);
    }

    const Vec3d mean_of_date = Frames::precess(0.0, j2000, time.tt());
    const Vec3d true_of_date = Frames::nutate(time, NutationDirection::MeanToTrue, mean_of_date);
    return Coordinates::vector_to_equatorial(true_of_date);
}

} // namespace almanac::astro
