#pragma once

/// @file inferior_planet.hpp
/// @brief Maximum elongation of Mercury and Venus, and peak magnitude of Venus.

#include "astro/illumination.hpp"
#include "astro/solar_geometry.hpp"
#include "astro/time_system.hpp"
#include "ephemeris/body.hpp"
#include "search/root_finder.hpp"

#include <optional>

namespace almanac::search
{
    /// @brief Static utility class for events of the planets inside the Earth's orbit.
    class InferiorPlanetSearch
    {
    public:
        InferiorPlanetSearch() = delete;

        /// @brief Next greatest elongation of Mercury or Venus after @p start.
        /// @return std::nullopt if no event is found in the two windows examined.
        /// @throws core::InvalidBodyError for any other body.
        [[nodiscard]] static std::optional<astro::ElongationEvent> max_elongation(
            ephemeris::Body body,
            const astro::Instant& start
        );

        /// @brief Next time Venus is brightest as seen from the Earth.
        /// @throws core::InvalidBodyError for any body other than Venus.
        /// @throws core::InternalError if the event cannot be bracketed.
        [[nodiscard]] static astro::IlluminationInfo peak_magnitude(
            ephemeris::Body body,
            const astro::Instant& start
        );

    private:
        /// @brief Relative-longitude interval [lo, hi] that brackets the next event.
        struct Window
        {
            f64 adjust_days;    ///< Offset applied to the start before searching
            f64 rlon_lo;
            f64 rlon_hi;
        };

        /// @brief Times at the window edges; the slope is negative at t1 and positive at t2.
        struct Bracket
        {
            astro::Instant t1;
            astro::Instant t2;
        };

        [[nodiscard]] static Window select_window(ephemeris::Body body, const astro::Instant& start,
                                                  f64 s1, f64 s2, bool inclusive_outer);

        [[nodiscard]] static Bracket bracket(ephemeris::Body body, const astro::Instant& start,
                                             const Window& window, const SearchFunction& slope);
    };

} // namespace almanac::search
