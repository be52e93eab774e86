#pragma once

/// @file frames.hpp
/// @brief Vector transforms between J2000, mean-of-date and true-of-date frames.

#include "astro/observer.hpp"
#include "astro/rotation.hpp"
#include "astro/time_system.hpp"
#include "core/types.hpp"

namespace almanac::astro
{
    /// @brief Static utility class applying frame rotations to position vectors.
    class Frames
    {
    public:
        Frames() = delete;

        /// @brief Precess @p pos from epoch @p tt1 to epoch @p tt2; one of them must be 0 (J2000).
        [[nodiscard]] static Vec3d precess(f64 tt1, const Vec3d& pos, f64 tt2);

        /// @brief Apply nutation for the tilt of @p time.
        [[nodiscard]] static Vec3d nutate(const Instant& time, NutationDirection direction, const Vec3d& pos);

        /// @brief Mean ecliptic of date to mean equator of date.
        [[nodiscard]] static Vec3d ecliptic_to_equator_of_date(const Instant& time, const Vec3d& ecl);

        /// @brief Observer position relative to the Earth's center in the true
        /// equator-of-date frame (AU), for a given sidereal time in hours.
        [[nodiscard]] static Vec3d observer_vector(const GeoLocation& observer, f64 sidereal_hours);

        /// @brief Observer position relative to the Earth's center in J2000 equatorial (AU).
        [[nodiscard]] static Vec3d observer_position(const Instant& time, const GeoLocation& observer);
    };

} // namespace almanac::astro
