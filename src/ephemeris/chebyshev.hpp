#pragma once

/// @file chebyshev.hpp
/// @brief Piecewise Chebyshev model of Pluto's heliocentric position.

#include "core/types.hpp"

#include <array>
#include <span>

namespace almanac::ephemeris
{
    /// @brief One segment: coefficients for x, y, z over [tt, tt + ndays].
    struct ChebyshevRecord
    {
        f64 tt;
        f64 ndays;
        std::array<std::array<f64, 3>, 19> coeff;
    };

    /// @brief Static utility class evaluating Chebyshev position models.
    class Chebyshev
    {
    public:
        Chebyshev() = delete;

        /// @brief Evaluate the segment that covers @p tt.
        /// @throws std::out_of_range if no segment covers @p tt.
        [[nodiscard]] static Vec3d evaluate(std::span<const ChebyshevRecord> model, f64 tt);

        /// @brief Pluto heliocentric J2000 equatorial position (AU).
        ///
        /// Valid for TT days -109573.5 .. 73413.5 relative to J2000 (1700-2200).
        [[nodiscard]] static Vec3d pluto(f64 tt);

        /// @brief The Pluto model segments.
        [[nodiscard]] static std::span<const ChebyshevRecord> pluto_model();
    };

} // namespace almanac::ephemeris
