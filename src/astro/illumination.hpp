#pragma once

/// @file illumination.hpp
/// @brief Phase angle and visual magnitude of Solar System bodies.

#include "astro/coordinates.hpp"
#include "astro/time_system.hpp"
#include "ephemeris/body.hpp"

#include <optional>

namespace almanac::astro
{
    /// @brief Brightness and illumination geometry of a body.
    struct IlluminationInfo
    {
        Instant time;
        f64 magnitude;              ///< Apparent visual magnitude
        f64 phase_angle;            ///< Sun-body-Earth angle (degrees)
        f64 phase_fraction;         ///< Illuminated fraction of the disc, 0..1
        f64 helio_dist;             ///< Distance from the Sun (AU)
        f64 geo_dist;               ///< Distance from the Earth (AU)
        Vec3d geo;                  ///< Geocentric J2000 vector (AU)
        Vec3d helio;                ///< Heliocentric J2000 vector (AU)
        std::optional<f64> ring_tilt;   ///< Saturn only: tilt of the rings toward the Earth (degrees)
    };

    /// @brief Static utility class for visual magnitudes.
    class Illumination
    {
    public:
        Illumination() = delete;

        /// @brief Illumination of @p body as seen from the Earth's center.
        ///
        /// Planet phase laws for Mercury and Venus follow Hilton (2005); Saturn
        /// includes its rings; the Moon uses a polynomial phase curve.
        /// @throws core::EarthNotAllowedError for the Earth.
        [[nodiscard]] static IlluminationInfo compute(ephemeris::Body body, const Instant& time);

    private:
        [[nodiscard]] static f64 moon_magnitude(f64 phase, f64 helio_dist, f64 geo_dist);
        [[nodiscard]] static f64 planet_magnitude(ephemeris::Body body, f64 phase, f64 helio_dist, f64 geo_dist);
    };

} // namespace almanac::astro
