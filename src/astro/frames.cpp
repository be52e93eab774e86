/// @file frames.cpp
/// @brief Implementation of frame transforms and the observer position.

#include "astro/frames.hpp"

#include "astro/earth_orientation.hpp"

#include <cmath>

namespace almanac::astro
{

Vec3d Frames::precess(f64 tt1, const Vec3d& pos, f64 tt2)
{
    return Rotations::precession(tt1, tt2).apply(pos);
}

Vec3d Frames::nutate(const Instant& time, NutationDirection direction, const Vec3d& pos)
{
    return Rotations::nutation(time, direction).apply(pos);
}

Vec3d Frames::ecliptic_to_equator_of_date(const Instant& time, const Vec3d& ecl)
{
    const f64 obliquity = EarthOrientation::mean_obliquity(time.tt()) * astro_constants::kDegToRad;
    return Rotations::ecliptic_to_equatorial(obliquity).apply(ecl);
}

// -----------------------------------------------------------------
// Geocentric observer position on the reference ellipsoid
//
// With f the flattening and df = 1 - f:
//   C = 1 / sqrt(cos^2(phi) + df^2 sin^2(phi)),  S = df^2 C
//   r_xy = (a C + h) cos(phi),  z = (a S + h) sin(phi)
// rotated to the local sidereal angle 15*st + lon.
// -----------------------------------------------------------------

Vec3d Frames::observer_vector(const GeoLocation& observer, f64 sidereal_hours)
{
    const f64 df = 1.0 - astro_constants::kEarthFlattening;
    const f64 df2 = df * df;
    const f64 phi = observer.latitude_deg * astro_constants::kDegToRad;
    const f64 sinphi = std::sin(phi);
    const f64 cosphi = std::cos(phi);
    const f64 c = 1.0 / std::sqrt(cosphi * cosphi + df2 * sinphi * sinphi);
    const f64 s = df2 * c;
    const f64 ht_km = observer.height_m / 1000.0;
    const f64 ach = astro_constants::kEarthRadiusKm * c + ht_km;
    const f64 ash = astro_constants::kEarthRadiusKm * s + ht_km;
    const f64 stlocl = (15.0 * sidereal_hours + observer.longitude_deg) * astro_constants::kDegToRad;

    return Vec3d(ach * cosphi * std::cos(stlocl),
                 ach * cosphi * std::sin(stlocl),
                 ash * sinphi) / astro_constants::kKmPerAu;
}

Vec3d Frames::observer_position(const Instant& time, const GeoLocation& observer)
{
    const f64 gast = EarthOrientation::sidereal_time(time);
    const Vec3d of_date = observer_vector(observer, gast);
    const Vec3d mean = nutate(time, NutationDirection::TrueToMean, of_date);
    return precess(time.tt(), mean, 0.0);
}

} // namespace almanac::astro
