#pragma once

/// @file rise_set.hpp
/// @brief Rise and set times of the Sun, Moon and planets.

#include "astro/observer.hpp"
#include "astro/time_system.hpp"
#include "ephemeris/body.hpp"

#include <optional>

namespace almanac::search
{
    /// @brief Which horizon crossing to search for.
    enum class Direction
    {
        Rise = +1,
        Set  = -1,
    };

    /// @brief Static utility class for rise/set searches.
    class RiseSetSearch
    {
    public:
        RiseSetSearch() = delete;

        /// @brief Next time after @p start that the top of @p body crosses the horizon.
        ///
        /// The limb is used for the Sun and the Moon, the center for planets.
        /// A standard refraction of 34 arcminutes at the horizon is applied.
        /// Each candidate crossing is bracketed between a lower and an upper
        /// culmination and refined with RootFinder.
        /// @return std::nullopt if no crossing occurs within @p limit_days
        ///         (e.g. polar day or night).
        /// @throws core::EarthNotAllowedError for the Earth.
        [[nodiscard]] static std::optional<astro::Instant> search(
            ephemeris::Body body,
            const astro::GeoLocation& observer,
            Direction direction,
            const astro::Instant& start,
            f64 limit_days
        );
    };

} // namespace almanac::search
