#pragma once

/// @file coordinates.hpp
/// @brief Coordinate value types and spherical transforms: Equatorial, Horizontal, Ecliptic.

#include "astro/observer.hpp"
#include "astro/refraction.hpp"
#include "astro/time_system.hpp"
#include "core/types.hpp"

namespace almanac::astro
{
    /// @brief Cartesian position (AU) tagged with the time it is valid for.
    struct AstroVector
    {
        Vec3d pos;
        Instant time;

        [[nodiscard]] f64 length() const;
    };

    /// @brief Equatorial coordinates.
    struct EquatorialCoord
    {
        f64 ra;     ///< Right ascension (hours, 0..24)
        f64 dec;    ///< Declination (degrees, -90..+90)
        f64 dist;   ///< Distance (AU)
    };

    /// @brief Horizontal (topocentric) coordinates, optionally refracted.
    struct HorizontalCoord
    {
        f64 azimuth;    ///< Degrees, 0=North, 90=East
        f64 altitude;   ///< Degrees above the horizon
        f64 ra;         ///< Right ascension after refraction (hours)
        f64 dec;        ///< Declination after refraction (degrees)
    };

    /// @brief Ecliptic coordinates, Cartesian and spherical.
    struct EclipticCoord
    {
        Vec3d vec;   ///< Cartesian (AU)
        f64 elat;    ///< Latitude (degrees)
        f64 elon;    ///< Longitude (degrees, 0..360)
    };

    /// @brief Static utility class for astronomical coordinate transformations.
    ///
    /// Angles in and out are degrees (RA in hours), distances in AU.
    class Coordinates
    {
    public:
        Coordinates() = delete;

        /// @brief Cartesian equatorial vector to RA/Dec/distance.
        /// @throws core::BadVectorError for the zero vector.
        [[nodiscard]] static EquatorialCoord vector_to_equatorial(const Vec3d& pos);

        /// @brief Equatorial of date (RA/Dec) to Horizontal (Az/Alt) for an observer.
        ///
        /// With refraction enabled the altitude is raised by the refraction
        /// angle and RA/Dec are moved along the vertical circle to match.
        /// Azimuth is never affected by refraction.
        /// @param ra Right ascension of date (hours).
        /// @param dec Declination of date (degrees).
        [[nodiscard]] static HorizontalCoord horizon(
            const Instant& time,
            const GeoLocation& observer,
            f64 ra,
            f64 dec,
            Refraction refraction
        );

        /// @brief Equatorial vector to ecliptic coordinates for an obliquity (radians).
        [[nodiscard]] static EclipticCoord rotate_equatorial_to_ecliptic(const Vec3d& pos,
                                                                          f64 obliquity_rad);

        /// @brief J2000 equatorial vector to J2000 ecliptic coordinates.
        [[nodiscard]] static EclipticCoord ecliptic(const Vec3d& equ);

        /// @brief Angle between two vectors in degrees, [0, 180].
        /// @throws core::BadVectorError if either vector is shorter than 1e-8 AU.
        [[nodiscard]] static f64 angle_between(const Vec3d& a, const Vec3d& b);

        /// @brief Wrap a longitude difference into (-180, +180].
        [[nodiscard]] static f64 longitude_offset(f64 diff);

        /// @brief Wrap a longitude into [0, 360).
        [[nodiscard]] static f64 normalize_longitude(f64 lon);
    };

} // namespace almanac::astro
