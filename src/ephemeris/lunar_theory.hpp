#pragma once

/// @file lunar_theory.hpp
/// @brief Geocentric Moon from the Improved Lunar Ephemeris series.

#include "astro/coordinates.hpp"
#include "astro/time_system.hpp"
#include "core/types.hpp"

namespace almanac::ephemeris
{
    /// @brief Geocentric Moon in the mean ecliptic and equinox of date.
    struct LunarPosition
    {
        f64 longitude;     ///< Ecliptic longitude (radians, 0..2pi)
        f64 latitude;      ///< Ecliptic latitude (radians)
        f64 distance_au;   ///< Distance from the Earth's center (AU)
    };

    /// @brief Static utility class for the lunar theory.
    ///
    /// Brown's theory as tabulated in the Improved Lunar Ephemeris (1954),
    /// following the formulation of Montenbruck & Pfleger, "Astronomy on the
    /// Personal Computer". Accuracy is a few arcseconds over several centuries.
    class LunarTheory
    {
    public:
        LunarTheory() = delete;

        /// @brief Geocentric ecliptic position of date for TT days since J2000.
        [[nodiscard]] static LunarPosition compute(f64 tt);

        /// @brief Geocentric Moon as a J2000 equatorial vector (AU).
        [[nodiscard]] static astro::AstroVector geo_moon(const astro::Instant& time);
    };

} // namespace almanac::ephemeris
