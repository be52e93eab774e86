#pragma once

/// @file body.hpp
/// @brief Solar System bodies known to the ephemeris.

#include "core/types.hpp"

#include <string_view>

namespace almanac::ephemeris
{
    /// @brief Body identifier. Planet values index the planetary theories.
    enum class Body : i32
    {
        Invalid = -1,
        Mercury = 0,
        Venus   = 1,
        Earth   = 2,
        Mars    = 3,
        Jupiter = 4,
        Saturn  = 5,
        Uranus  = 6,
        Neptune = 7,
        Pluto   = 8,
        Sun     = 9,
        Moon    = 10,
    };

    /// @brief Display name of a body ("Invalid" for unknown values).
    [[nodiscard]] const char* body_name(Body body);

    /// @brief Look up a body by its English name (case-sensitive), Body::Invalid if unknown.
    [[nodiscard]] Body body_from_name(std::string_view name);

    /// @brief Static utility class for orbital periods.
    class Bodies
    {
    public:
        Bodies() = delete;

        /// @brief Sidereal orbital period around the Sun in days.
        /// @throws core::InvalidBodyError for the Sun, the Moon and Invalid.
        [[nodiscard]] static f64 orbital_period(Body body);

        /// @brief Mean time between successive returns to the same Sun-Earth-body geometry, in days.
        /// @throws core::EarthNotAllowedError for the Earth.
        /// @throws core::InvalidBodyError for the Sun and Invalid.
        [[nodiscard]] static f64 synodic_period(Body body);

        /// @brief True for planets whose orbits lie outside the Earth's.
        [[nodiscard]] static bool is_superior_planet(Body body);
    };

} // namespace almanac::ephemeris
