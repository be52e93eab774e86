#pragma once

/// @file ephemeris.hpp
/// @brief Heliocentric positions of Solar System bodies.

#include "astro/coordinates.hpp"
#include "astro/time_system.hpp"
#include "ephemeris/body.hpp"

namespace almanac::ephemeris
{
    /// @brief Static utility class dispatching to the per-body theories.
    ///
    /// All vectors are J2000 mean equatorial, in AU, without light-time correction.
    class Ephemeris
    {
    public:
        Ephemeris() = delete;

        /// @brief Position of @p body relative to the Sun's center.
        ///
        /// Planets use VSOP87, Pluto a Chebyshev fit, the Moon the Earth's
        /// position plus the lunar theory; the Sun is the origin.
        /// @throws core::InvalidBodyError for Body::Invalid.
        [[nodiscard]] static astro::AstroVector helio_vector(Body body, const astro::Instant& time);

        /// @brief Heliocentric position of the Earth's center.
        [[nodiscard]] static astro::AstroVector earth(const astro::Instant& time);
    };

} // namespace almanac::ephemeris
