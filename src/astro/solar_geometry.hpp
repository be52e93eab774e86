#pragma once

/// @file solar_geometry.hpp
/// @brief Positions of bodies relative to the Sun as seen from the Earth.

#include "astro/coordinates.hpp"
#include "astro/time_system.hpp"
#include "ephemeris/body.hpp"

namespace almanac::astro
{
    /// @brief Which part of the day a body is best seen in.
    enum class Visibility
    {
        Morning,   ///< West of the Sun, seen before sunrise
        Evening,   ///< East of the Sun, seen after sunset
    };

    /// @brief Angular separation of a body from the Sun.
    struct ElongationEvent
    {
        Instant time;
        Visibility visibility;
        f64 elongation;             ///< Sun-Earth-body angle (degrees)
        f64 ecliptic_separation;    ///< Difference in ecliptic longitude (degrees, 0..180)
    };

    /// @brief Static utility class for Sun-relative geometry.
    class SolarGeometry
    {
    public:
        SolarGeometry() = delete;

        /// @brief Apparent geocentric Sun in the true ecliptic of date.
        ///
        /// Corrected for light time by back-dating the Earth by 1/c days.
        [[nodiscard]] static EclipticCoord sun_position(const Instant& time);

        /// @brief Heliocentric J2000 ecliptic longitude of @p body (degrees).
        /// @throws core::InvalidBodyError for the Sun.
        [[nodiscard]] static f64 ecliptic_longitude(ephemeris::Body body, const Instant& time);

        /// @brief Sun-Earth-body angle in degrees, [0, 180].
        /// @throws core::EarthNotAllowedError for the Earth.
        [[nodiscard]] static f64 angle_from_sun(ephemeris::Body body, const Instant& time);

        /// @brief Geocentric ecliptic longitude of @p body minus that of the Sun, [0, 360).
        /// @throws core::EarthNotAllowedError for the Earth.
        [[nodiscard]] static f64 longitude_from_sun(ephemeris::Body body, const Instant& time);

        /// @brief Elongation and morning/evening visibility of @p body.
        [[nodiscard]] static ElongationEvent elongation(ephemeris::Body body, const Instant& time);

        /// @brief Moon's longitude from the Sun: 0 new, 90 first quarter, 180 full, 270 third quarter.
        [[nodiscard]] static f64 moon_phase(const Instant& time);
    };

} // namespace almanac::astro
