#pragma once

/// @file earth_orientation.hpp
/// @brief Nutation, obliquity of the ecliptic and Earth rotation.

#include "astro/time_system.hpp"
#include "core/types.hpp"

namespace almanac::astro
{
    /// @brief Nutation angles in arcseconds.
    struct Nutation
    {
        f64 dpsi;   ///< Nutation in longitude
        f64 deps;   ///< Nutation in obliquity
    };

    /// @brief Snapshot of Earth's axis orientation at one dynamical time.
    struct EarthTilt
    {
        f64 tt;                      ///< TT days since J2000 this snapshot is for
        f64 dpsi;                    ///< Nutation in longitude (arcseconds)
        f64 deps;                    ///< Nutation in obliquity (arcseconds)
        f64 mean_obliquity;          ///< Mean obliquity of the ecliptic (degrees)
        f64 true_obliquity;          ///< True obliquity of the ecliptic (degrees)
        f64 equation_of_equinoxes;   ///< dpsi * cos(mean obliquity) / 15 (seconds of time)
    };

    /// @brief Static utility class for the orientation of the Earth in space.
    ///
    /// Nutation follows the truncated IAU 2000B luni-solar model. Sidereal
    /// time is Greenwich apparent sidereal time built on the Earth Rotation Angle.
    class EarthOrientation
    {
    public:
        EarthOrientation() = delete;

        /// @brief IAU 2000B nutation angles for TT days since J2000.
        [[nodiscard]] static Nutation nutation(f64 tt);

        /// @brief Mean obliquity of the ecliptic in degrees.
        [[nodiscard]] static f64 mean_obliquity(f64 tt);

        /// @brief Full tilt snapshot. Prefer Instant::tilt(), which caches this.
        [[nodiscard]] static EarthTilt tilt(f64 tt);

        /// @brief Earth Rotation Angle in degrees, [0, 360).
        [[nodiscard]] static f64 earth_rotation_angle(f64 ut);

        /// @brief Greenwich apparent sidereal time in hours, [0, 24).
        [[nodiscard]] static f64 sidereal_time(const Instant& time);
    };

} // namespace almanac::astro
