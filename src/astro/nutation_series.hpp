#pragma once

/// @file nutation_series.hpp
/// @brief Coefficient table of the IAU 2000B luni-solar nutation series.

#include "core/types.hpp"

#include <array>
#include <span>

namespace almanac::astro
{
    /// @brief One periodic term.
    ///
    /// The argument is sum(multipliers[k] * {l, l', F, D, Om}[k]). With
    /// t in Julian centuries the contributions, in units of 0.1 microarcsecond, are
    ///   dpsi += (ps + pst*t) * sin(arg) + pc * cos(arg)
    ///   deps += (ec + ect*t) * cos(arg) + es * sin(arg)
    struct NutationTerm
    {
        std::array<i32, 5> multipliers;
        f64 ps;
        f64 pst;
        f64 pc;
        f64 ec;
        f64 ect;
        f64 es;
    };

    /// @brief The 77 luni-solar terms, largest first.
    [[nodiscard]] std::span<const NutationTerm> nutation_terms();

} // namespace almanac::astro
