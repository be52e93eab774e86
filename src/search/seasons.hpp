#pragma once

/// @file seasons.hpp
/// @brief Solar longitude search, equinoxes and solstices.

#include "astro/time_system.hpp"

#include <optional>

namespace almanac::search
{
    /// @brief The four changes of season in one calendar year.
    struct SeasonInfo
    {
        astro::Instant mar_equinox;
        astro::Instant jun_solstice;
        astro::Instant sep_equinox;
        astro::Instant dec_solstice;
    };

    /// @brief Static utility class for the Sun's apparent longitude.
    class SeasonSearch
    {
    public:
        SeasonSearch() = delete;

        /// @brief When the Sun reaches apparent ecliptic longitude @p target_lon (true equinox of date).
        ///
        /// Keep @p limit_days below about 10 so the longitude changes by far
        /// less than 180 degrees inside the window.
        /// @return std::nullopt if the longitude is not reached in [start, start + limit_days].
        [[nodiscard]] static std::optional<astro::Instant> sun_longitude(
            f64 target_lon,
            const astro::Instant& start,
            f64 limit_days
        );

        /// @brief Equinoxes and solstices for @p year.
        /// @throws core::InternalError if one of the four events is not found.
        [[nodiscard]] static SeasonInfo seasons(i32 year);

    private:
        [[nodiscard]] static astro::Instant find_change(f64 target_lon, i32 year, i32 month, i32 day);
    };

} // namespace almanac::search
