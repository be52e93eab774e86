#pragma once

/// @file refraction.hpp
/// @brief Atmospheric refraction near the horizon (Saemundsson).

#include "core/types.hpp"

namespace almanac::astro
{
    /// @brief Refraction model selector.
    enum class Refraction
    {
        Airless,       ///< No correction
        Normal,        ///< Saemundsson, tapered to zero toward the nadir
        JplHorizons,   ///< Saemundsson held constant below -1 degree, as JPL Horizons does
    };

    /// @brief Static utility class for refraction angles. All angles in degrees.
    class Refractions
    {
    public:
        Refractions() = delete;

        /// @brief Amount the atmosphere raises a body at geometric @p altitude.
        ///
        /// R = 1.02 / tan(h + 10.3 / (h + 5.11)) arcminutes with h clamped to -1.
        /// Returns 0 for Airless and for altitudes outside [-90, 90].
        [[nodiscard]] static f64 refraction_angle(Refraction refraction, f64 altitude);

        /// @brief Correction (<= 0) that removes refraction from an observed altitude.
        ///
        /// Solves h + R(h) = @p bent_altitude by fixed-point iteration to 1e-14 degrees.
        /// @throws core::NoConvergeError after 100 iterations without convergence.
        [[nodiscard]] static f64 inverse_refraction_angle(Refraction refraction, f64 bent_altitude);
    };

} // namespace almanac::astro
