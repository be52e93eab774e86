#pragma once

/// @file lunar_apsis.hpp
/// @brief Lunar perigee and apogee searches.

#include "astro/time_system.hpp"

namespace almanac::search
{
    /// @brief Closest or farthest point of an orbit.
    enum class ApsisKind : i32
    {
        Pericenter = 0,
        Apocenter = 1,
        Invalid = 2,
    };

    /// @brief An apsis event of the Moon's orbit around the Earth.
    struct Apsis
    {
        astro::Instant time;
        ApsisKind kind;
        f64 dist_au;
        f64 dist_km;
    };

    /// @brief Static utility class for lunar apsis searches.
    class LunarApsisSearch
    {
    public:
        LunarApsisSearch() = delete;

        /// @brief First perigee or apogee after @p start, whichever comes first.
        /// @throws core::InternalError if nothing is found within two synodic months.
        [[nodiscard]] static Apsis search(const astro::Instant& start);

        /// @brief The apsis of the opposite kind following @p previous.
        /// @throws std::invalid_argument if @p previous has kind Invalid.
        /// @throws core::InternalError if the next apsis has the same kind.
        [[nodiscard]] static Apsis next(const Apsis& previous);
    };

} // namespace almanac::search
