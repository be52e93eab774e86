#pragma once

/// @file relative_longitude.hpp
/// @brief Conjunctions, oppositions and other planet-Earth longitude configurations.

#include "astro/time_system.hpp"
#include "ephemeris/body.hpp"

namespace almanac::search
{
    /// @brief Static utility class for relative-longitude searches.
    class RelativeLongitudeSearch
    {
    public:
        RelativeLongitudeSearch() = delete;

        /// @brief Next time the heliocentric longitudes of Earth and @p body differ by @p target_rel_lon.
        ///
        /// The difference is measured as Earth minus body for superior planets
        /// and body minus Earth for inferior ones, so 0 is opposition/inferior
        /// conjunction and 180 is conjunction/superior conjunction.
        /// @throws core::EarthNotAllowedError for the Earth.
        /// @throws core::InvalidBodyError for the Sun and the Moon.
        /// @throws core::NoConvergeError after 100 iterations.
        [[nodiscard]] static astro::Instant search(
            ephemeris::Body body,
            f64 target_rel_lon,
            const astro::Instant& start
        );

        /// @brief Signed error (-180, 180] between the current and target relative longitude.
        [[nodiscard]] static f64 offset(ephemeris::Body body, const astro::Instant& time,
                                        f64 direction, f64 target_rel_lon);
    };

} // namespace almanac::search
