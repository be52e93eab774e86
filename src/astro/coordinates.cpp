/// @file coordinates.cpp
/// @brief Implementation of astronomical coordinate transformations.

#include "astro/coordinates.hpp"

#include "astro/earth_orientation.hpp"
#include "astro/rotation.hpp"
#include "core/error.hpp"
#include "core/logger.hpp"

#include <glm/geometric.hpp>

#include <cmath>

namespace almanac::astro
{

f64 AstroVector::length() const
{
    return glm::length(pos);
}

// -----------------------------------------------------------------
// Cartesian -> RA/Dec
//
// RA  = atan2(y, x) / 15, normalized to [0, 24)
// Dec = atan2(z, sqrt(x^2 + y^2))
// On the polar axis RA is undefined and reported as 0.
// -----------------------------------------------------------------

EquatorialCoord Coordinates::vector_to_equatorial(const Vec3d& pos)
{
    const f64 xyproj = pos.x * pos.x + pos.y * pos.y;
    const f64 dist = std::sqrt(xyproj + pos.z * pos.z);

    if (xyproj == 0.0)
    {
        if (pos.z == 0.0)
        {
            ALM_CORE_ERROR("Coordinates: cannot convert a zero-length vector to RA/Dec");
            throw core::BadVectorError();
        }
        return EquatorialCoord{
            .ra   = 0.0,
            .dec  = (pos.z < 0.0) ? -90.0 : +90.0,
            .dist = dist,
        };
    }

    f64 ra = std::atan2(pos.y, pos.x) * astro_constants::kRadToHour;
    if (ra < 0.0)
    {
        ra += 24.0;
    }

    return EquatorialCoord{
        .ra   = ra,
        .dec  = std::atan2(pos.z, std::sqrt(xyproj)) * astro_constants::kRadToDeg,
        .dist = dist,
    };
}

// -----------------------------------------------------------------
// Equatorial of date -> Horizontal
//
// Unit vectors toward the observer's zenith, north and west are built in
// the Earth-fixed frame, then spun by -GAST into the equatorial frame:
//   uz = [cos(lat)cos(lon), cos(lat)sin(lon), sin(lat)]
//   un = [-sin(lat)cos(lon), -sin(lat)sin(lon), cos(lat)]
//   uw = [sin(lon), -cos(lon), 0]
//
// With p the unit vector toward the body:
//   az = -atan2(p.uw, p.un)
//   zd = atan2(|(p.un, p.uw)|, p.uz)
// -----------------------------------------------------------------

HorizontalCoord Coordinates::horizon(
    const Instant& time,
    const GeoLocation& observer,
    f64 ra,
    f64 dec,
    Refraction refraction)
{
    const f64 lat = observer.latitude_deg * astro_constants::kDegToRad;
    const f64 lon = observer.longitude_deg * astro_constants::kDegToRad;
    const f64 sinlat = std::sin(lat);
    const f64 coslat = std::cos(lat);
    const f64 sinlon = std::sin(lon);
    const f64 coslon = std::cos(lon);

    const f64 ra_rad = ra * astro_constants::kHourToRad;
    const f64 dec_rad = dec * astro_constants::kDegToRad;
    const f64 sindc = std::sin(dec_rad);
    const f64 cosdc = std::cos(dec_rad);

    const RotationMatrix spin = Rotations::spin(-15.0 * EarthOrientation::sidereal_time(time));
    const Vec3d uz = spin.apply(Vec3d(coslat * coslon, coslat * sinlon, sinlat));
    const Vec3d un = spin.apply(Vec3d(-sinlat * coslon, -sinlat * sinlon, coslat));
    const Vec3d uw = spin.apply(Vec3d(sinlon, -coslon, 0.0));

    const Vec3d p(cosdc * std::cos(ra_rad), cosdc * std::sin(ra_rad), sindc);

    const f64 pz = glm::dot(p, uz);
    const f64 pn = glm::dot(p, un);
    const f64 pw = glm::dot(p, uw);

    f64 proj = std::sqrt(pn * pn + pw * pw);
    f64 az = 0.0;
    if (proj > 0.0)
    {
        az = -std::atan2(pw, pn) * astro_constants::kRadToDeg;
        if (az < 0.0)
        {
            az += 360.0;
        }
        if (az >= 360.0)
        {
            az -= 360.0;
        }
    }

    f64 zd = std::atan2(proj, pz) * astro_constants::kRadToDeg;
    f64 hor_ra = ra;
    f64 hor_dec = dec;

    if (refraction != Refraction::Airless)
    {
        const f64 zd0 = zd;
        const f64 refr = Refractions::refraction_angle(refraction, 90.0 - zd);
        zd -= refr;

        if (refr > 0.0 && zd > 3.0e-4)
        {
            // Slide p along the great circle through the zenith to the refracted zenith distance
            const f64 sinzd = std::sin(zd * astro_constants::kDegToRad);
            const f64 coszd = std::cos(zd * astro_constants::kDegToRad);
            const f64 sinzd0 = std::sin(zd0 * astro_constants::kDegToRad);
            const f64 coszd0 = std::cos(zd0 * astro_constants::kDegToRad);

            const Vec3d pr = ((p - coszd0 * uz) / sinzd0) * sinzd + uz * coszd;

            proj = std::sqrt(pr.x * pr.x + pr.y * pr.y);
            if (proj > 0.0)
            {
                hor_ra = std::atan2(pr.y, pr.x) * astro_constants::kRadToHour;
                if (hor_ra < 0.0)
                {
                    hor_ra += 24.0;
                }
                if (hor_ra >= 24.0)
                {
                    hor_ra -= 24.0;
                }
            }
            else
            {
                hor_ra = 0.0;
            }
            hor_dec = std::atan2(pr.z, proj) * astro_constants::kRadToDeg;
        }
    }

    return HorizontalCoord{
        .azimuth  = az,
        .altitude = 90.0 - zd,
        .ra       = hor_ra,
        .dec      = hor_dec,
    };
}

// -----------------------------------------------------------------
// Equatorial -> Ecliptic
//
// ex =  x
// ey =  y cos(eps) + z sin(eps)
// ez = -y sin(eps) + z cos(eps)
// -----------------------------------------------------------------

EclipticCoord Coordinates::rotate_equatorial_to_ecliptic(const Vec3d& pos, f64 obliquity_rad)
{
    const Vec3d ecl = Rotations::equatorial_to_ecliptic(obliquity_rad).apply(pos);

    const f64 xyproj = std::sqrt(ecl.x * ecl.x + ecl.y * ecl.y);
    f64 elon = 0.0;
    if (xyproj > 0.0)
    {
        elon = std::atan2(ecl.y, ecl.x) * astro_constants::kRadToDeg;
        if (elon < 0.0)
        {
            elon += 360.0;
        }
    }

    return EclipticCoord{
        .vec  = ecl,
        .elat = std::atan2(ecl.z, xyproj) * astro_constants::kRadToDeg,
        .elon = elon,
    };
}

EclipticCoord Coordinates::ecliptic(const Vec3d& equ)
{
    // Mean obliquity of the J2000 ecliptic
    constexpr f64 kObliquityJ2000 = 0.40909260059599012;
    return rotate_equatorial_to_ecliptic(equ, kObliquityJ2000);
}

f64 Coordinates::angle_between(const Vec3d& a, const Vec3d& b)
{
    const f64 r = glm::length(a) * glm::length(b);
    if (r < 1.0e-8)
    {
        ALM_CORE_ERROR("Coordinates: angle between vectors of length product {}", r);
        throw core::BadVectorError();
    }

    const f64 dot = glm::dot(a, b) / r;
    if (dot <= -1.0)
    {
        return 180.0;
    }
    if (dot >= 1.0)
    {
        return 0.0;
    }
    return std::acos(dot) * astro_constants::kRadToDeg;
}

f64 Coordinates::longitude_offset(f64 diff)
{
    f64 offset = diff;
    while (offset <= -180.0)
    {
        offset += 360.0;
    }
    while (offset > 180.0)
    {
        offset -= 360.0;
    }
    return offset;
}

f64 Coordinates::normalize_longitude(f64 lon)
{
    while (lon < 0.0)
    {
        lon += 360.0;
    }
    while (lon >= 360.0)
    {
        lon -= 360.0;
    }
    return lon;
}

} // namespace almanac::astro
