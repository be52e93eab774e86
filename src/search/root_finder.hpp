#pragma once

/// @file root_finder.hpp
/// @brief Bounded search for the ascending root of a function of time.

#include "astro/time_system.hpp"
#include "core/types.hpp"

#include <functional>
#include <optional>

namespace almanac::search
{
    /// @brief Scalar function of time whose ascending zero crossing marks an event.
    using SearchFunction = std::function<f64(const astro::Instant&)>;

    /// @brief Static utility class for root finding.
    class RootFinder
    {
    public:
        RootFinder() = delete;

        /// @brief Find the time in [t1, t2] where @p func crosses zero going upward.
        ///
        /// Combines quadratic interpolation through three samples with
        /// bisection. The window must be narrow enough to contain at most one
        /// root of either sign. Exceptions thrown by @p func propagate.
        ///
        /// @param tolerance_seconds Stop once the root is bracketed this tightly.
        /// @return The root, or std::nullopt when the window holds no ascending
        ///         root or more than one root.
        /// @throws core::NoConvergeError after 20 iterations.
        [[nodiscard]] static std::optional<astro::Instant> search(
            const SearchFunction& func,
            const astro::Instant& t1,
            const astro::Instant& t2,
            f64 tolerance_seconds
        );

    private:
        /// @brief Root of the parabola through (-1, fa), (0, fm), (1, fb) mapped back to time.
        struct QuadraticRoot
        {
            f64 ut;      ///< Root time (UT days)
            f64 df_dt;   ///< Slope of the parabola at the root (per day)
        };

        [[nodiscard]] static std::optional<QuadraticRoot> quad_interp(f64 tm, f64 dt, f64 fa, f64 fm, f64 fb);
    };

} // namespace almanac::search
