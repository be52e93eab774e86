#pragma once

/// @file vsop.hpp
/// @brief Truncated VSOP87 heliocentric theory for the eight major planets.

#include "core/types.hpp"
#include "ephemeris/body.hpp"

#include <span>

namespace almanac::ephemeris
{
    /// @brief One periodic term A cos(B + C t), t in Julian millennia from J2000.
    struct VsopTerm
    {
        f64 amplitude;
        f64 phase;
        f64 frequency;
    };

    /// @brief Terms multiplied by the same power of t.
    using VsopSeries = std::span<const VsopTerm>;

    /// @brief Series for one planet: index k of each coordinate is the t^k series.
    struct VsopModel
    {
        std::span<const VsopSeries> longitude;   ///< radians
        std::span<const VsopSeries> latitude;    ///< radians
        std::span<const VsopSeries> radius;      ///< AU
    };

    /// @brief Static utility class evaluating the VSOP87 series.
    class Vsop
    {
    public:
        Vsop() = delete;

        /// @brief Heliocentric position in J2000 equatorial coordinates (AU).
        /// @param body Mercury..Neptune.
        /// @param tt TT days since J2000.
        /// @throws core::InvalidBodyError for any other body.
        [[nodiscard]] static Vec3d position(Body body, f64 tt);

        /// @brief Coefficient tables for a planet (Mercury..Neptune).
        /// @throws core::InvalidBodyError for any other body.
        [[nodiscard]] static const VsopModel& model(Body body);

    private:
        [[nodiscard]] static f64 evaluate(std::span<const VsopSeries> formula, f64 t);
    };

} // namespace almanac::ephemeris
