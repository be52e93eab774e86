/// @file vsop.cpp
/// @brief Evaluation of the VSOP87 series.

#include "ephemeris/vsop.hpp"

#include <cmath>

namespace almanac::ephemeris
{

f64 Vsop::evaluate(std::span<const VsopSeries> formula, f64 t)
{
    f64 tpower = 1.0;
    f64 coord = 0.0;
    for (const VsopSeries& series : formula)
    {
        f64 sum = 0.0;
        for (const VsopTerm& term : series)
        {
            sum += term.amplitude * std::cos(term.phase + term.frequency * t);
        }
        coord += tpower * sum;
        tpower *= t;
    }
    return coord;
}

// -----------------------------------------------------------------
// Spherical ecliptic (L, B, R) -> Cartesian, then the VSOP87 dynamical
// ecliptic of J2000 is rotated onto the J2000 mean equator (FK5):
//   x' = x + 0.000000440360 y - 0.000000190919 z
//   y' = -0.000000479966 x + 0.917482137087 y - 0.397776982902 z
//   z' = 0.397776982902 y + 0.917482137087 z
// -----------------------------------------------------------------

Vec3d Vsop::position(Body body, f64 tt)
{
    const VsopModel& planet = model(body);
    const f64 t = tt / astro_constants::kDaysPerMillennium;

    const f64 lon = evaluate(planet.longitude, t);
    const f64 lat = evaluate(planet.latitude, t);
    const f64 rad = evaluate(planet.radius, t);

    const f64 r_coslat = rad * std::cos(lat);
    const f64 ex = r_coslat * std::cos(lon);
    const f64 ey = r_coslat * std::sin(lon);
    const f64 ez = rad * std::sin(lat);

    return Vec3d(ex + 0.000000440360 * ey - 0.000000190919 * ez,
                 -0.000000479966 * ex + 0.917482137087 * ey - 0.397776982902 * ez,
                 0.397776982902 * ey + 0.917482137087 * ez);
}

} // namespace almanac::ephemeris
