/// @file illumination.cpp
/// @brief Implementation of phase and magnitude models.

#include "astro/illumination.hpp"

#include "core/error.hpp"
#include "core/logger.hpp"
#include "ephemeris/ephemeris.hpp"
#include "ephemeris/lunar_theory.hpp"

#include <glm/geometric.hpp>

#include <cmath>

namespace almanac::astro
{

using ephemeris::Body;

// -----------------------------------------------------------------
// Moon
//
// m = -12.717 + 1.49 |a| + 0.0431 a^4 + 5 log10(r * d / d_mean), a in radians
// -----------------------------------------------------------------

f64 Illumination::moon_magnitude(f64 phase, f64 helio_dist, f64 geo_dist)
{
    const f64 rad = phase * astro_constants::kDegToRad;
    const f64 rad2 = rad * rad;
    constexpr f64 kMoonMeanDistanceAu = 385000.6 / astro_constants::kKmPerAu;

    return -12.717 + 1.49 * std::abs(rad) + 0.0431 * rad2 * rad2
         + 5.0 * std::log10(helio_dist * (geo_dist / kMoonMeanDistanceAu));
}

// -----------------------------------------------------------------
// Planets: m = c0 + c1 x + c2 x^2 + c3 x^3 + 5 log10(r d), x = phase / 100
// -----------------------------------------------------------------

f64 Illumination::planet_magnitude(Body body, f64 phase, f64 helio_dist, f64 geo_dist)
{
    f64 c0 = 0.0;
    f64 c1 = 0.0;
    f64 c2 = 0.0;
    f64 c3 = 0.0;

    switch (body)
    {
        case Body::Mercury:
            c0 = -0.60; c1 = +4.98; c2 = -4.88; c3 = +3.02;
            break;
        case Body::Venus:
            if (phase < 163.6)
            {
                c0 = -4.47; c1 = +1.03; c2 = +0.57; c3 = +0.13;
            }
            else
            {
                c0 = +0.98; c1 = -1.02;
            }
            break;
        case Body::Mars:
            c0 = -1.52; c1 = +1.60;
            break;
        case Body::Jupiter:
            c0 = -9.40; c1 = +0.50;
            break;
        case Body::Uranus:
            c0 = -7.19; c1 = +0.25;
            break;
        case Body::Neptune:
            c0 = -6.87;
            break;
        case Body::Pluto:
            c0 = -1.00; c1 = +4.00;
            break;
        default:
            ALM_CORE_ERROR("Illumination: no magnitude model for {}", ephemeris::body_name(body));
            throw core::InvalidBodyError();
    }

    const f64 x = phase / 100.0;
    return c0 + x * (c1 + x * (c2 + x * c3)) + 5.0 * std::log10(helio_dist * geo_dist);
}

IlluminationInfo Illumination::compute(Body body, const Instant& time)
{
    if (body == Body::Earth)
    {
        ALM_CORE_ERROR("Illumination: magnitude requested for the Earth");
        throw core::EarthNotAllowedError();
    }

    const Vec3d earth = ephemeris::Ephemeris::earth(time).pos;

    Vec3d gc(0.0);
    Vec3d hc(0.0);
    f64 phase = 0.0;   // the Sun has no phase angle

    if (body == Body::Sun)
    {
        gc = -earth;
    }
    else
    {
        if (body == Body::Moon)
        {
            gc = ephemeris::LunarTheory::geo_moon(time).pos;
            hc = earth + gc;
        }
        else
        {
            hc = ephemeris::Ephemeris::helio_vector(body, time).pos;
            gc = hc - earth;
        }
        phase = Coordinates::angle_between(gc, hc);
    }

    const f64 geo_dist = glm::length(gc);
    const f64 helio_dist = glm::length(hc);

    f64 mag = 0.0;
    std::optional<f64> ring_tilt;

    if (body == Body::Sun)
    {
        mag = -0.17 + 5.0 * std::log10(geo_dist / astro_constants::kAuPerParsec);
    }
    else if (body == Body::Moon)
    {
        mag = moon_magnitude(phase, helio_dist, geo_dist);
    }
    else if (body == Body::Saturn)
    {
        // Rings (Schlyter): plane inclined 28.06 deg to the ecliptic, node 169.51 deg
        const EclipticCoord eclip = Coordinates::ecliptic(gc);
        const f64 ir = 28.06 * astro_constants::kDegToRad;
        const f64 nr = (169.51 + 3.82e-5 * time.tt()) * astro_constants::kDegToRad;
        const f64 lat = eclip.elat * astro_constants::kDegToRad;
        const f64 lon = eclip.elon * astro_constants::kDegToRad;

        const f64 tilt = std::asin(std::sin(lat) * std::cos(ir)
                                 - std::cos(lat) * std::sin(ir) * std::sin(lon - nr));
        const f64 sin_tilt = std::sin(std::abs(tilt));

        mag = -9.0 + 0.044 * phase
            + sin_tilt * (-2.6 + 1.2 * sin_tilt)
            + 5.0 * std::log10(helio_dist * geo_dist);
        ring_tilt = tilt * astro_constants::kRadToDeg;
    }
    else
    {
        mag = planet_magnitude(body, phase, helio_dist, geo_dist);
    }

    return IlluminationInfo{
        .time           = time,
        .magnitude      = mag,
        .phase_angle    = phase,
        .phase_fraction = (1.0 + std::cos(phase * astro_constants::kDegToRad)) / 2.0,
        .helio_dist     = helio_dist,
        .geo_dist       = geo_dist,
        .geo            = gc,
        .helio          = hc,
        .ring_tilt      = ring_tilt,
    };
}

} // namespace almanac::astro
