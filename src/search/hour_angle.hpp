#pragma once

/// @file hour_angle.hpp
/// @brief Search for the time a body reaches a given hour angle (culmination and friends).

#include "astro/coordinates.hpp"
#include "astro/observer.hpp"
#include "astro/time_system.hpp"
#include "ephemeris/body.hpp"

namespace almanac::search
{
    /// @brief A body at the requested hour angle.
    struct HourAngleEvent
    {
        astro::Instant time;
        astro::HorizontalCoord hor;   ///< Position at @c time with normal refraction
    };

    /// @brief Static utility class for hour-angle searches.
    class HourAngleSearch
    {
    public:
        HourAngleSearch() = delete;

        /// @brief First time at or after @p start when @p body has local hour angle @p hour_angle.
        ///
        /// Hour angle 0 is upper culmination (crossing the meridian), 12 the
        /// lower culmination. The first step always moves forward in time;
        /// later steps take the shortest correction either way and stop below
        /// 0.1 second of sidereal time.
        /// @throws core::EarthNotAllowedError for the Earth.
        /// @throws std::invalid_argument if @p hour_angle is outside [0, 24).
        [[nodiscard]] static HourAngleEvent search(
            ephemeris::Body body,
            const astro::GeoLocation& observer,
            f64 hour_angle,
            const astro::Instant& start
        );
    };

} // namespace almanac::search
