#pragma once

/// @file moon_phase.hpp
/// @brief Lunar phase and quarter searches.

#include "astro/time_system.hpp"

#include <optional>

namespace almanac::search
{
    /// @brief One of the four calendar lunar phases.
    struct MoonQuarter
    {
        i32 quarter;            ///< 0 new moon, 1 first quarter, 2 full moon, 3 third quarter
        astro::Instant time;
    };

    /// @brief Static utility class for lunar phase searches.
    class MoonPhaseSearch
    {
    public:
        MoonPhaseSearch() = delete;

        /// @brief When the Moon's longitude from the Sun next equals @p target_lon.
        ///
        /// The event is predicted from the mean synodic month and searched
        /// within 0.9 days either side of the prediction.
        /// @return std::nullopt if the phase is not reached within @p limit_days.
        [[nodiscard]] static std::optional<astro::Instant> search_phase(
            f64 target_lon,
            const astro::Instant& start,
            f64 limit_days
        );

        /// @brief First lunar quarter after @p start.
        /// @throws core::InternalError if no quarter is found within 10 days.
        [[nodiscard]] static MoonQuarter search_quarter(const astro::Instant& start);

        /// @brief The quarter following @p previous.
        /// @throws core::InternalError if the result is not the next quarter in sequence.
        [[nodiscard]] static MoonQuarter next_quarter(const MoonQuarter& previous);
    };

} // namespace almanac::search
