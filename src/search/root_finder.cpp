/// @file root_finder.cpp
/// @brief Implementation of the ascending-root search.

#include "search/root_finder.hpp"

#include "core/error.hpp"
#include "core/logger.hpp"

#include <cmath>

namespace almanac::search
{

// -----------------------------------------------------------------
// Parabola through three equally spaced samples, x in [-1, 1]:
//   f(x) = Q x^2 + R x + S
//   Q = (fb + fa)/2 - fm,  R = (fb - fa)/2,  S = fm
// Rejected when the parabola has no root or two roots in [-1, 1].
// -----------------------------------------------------------------

std::optional<RootFinder::QuadraticRoot> RootFinder::quad_interp(f64 tm, f64 dt, f64 fa, f64 fm, f64 fb)
{
    const f64 q = (fb + fa) / 2.0 - fm;
    const f64 r = (fb - fa) / 2.0;
    const f64 s = fm;
    f64 x = 0.0;

    if (q == 0.0)
    {
        // Straight line
        if (r == 0.0)
        {
            return std::nullopt;
        }
        x = -s / r;
        if (x < -1.0 || x > 1.0)
        {
            return std::nullopt;
        }
    }
    else
    {
        const f64 u = r * r - 4.0 * q * s;
        if (u <= 0.0)
        {
            return std::nullopt;
        }

        const f64 ru = std::sqrt(u);
        const f64 x1 = (-r + ru) / (2.0 * q);
        const f64 x2 = (-r - ru) / (2.0 * q);
        const bool x1_inside = (x1 >= -1.0 && x1 <= 1.0);
        const bool x2_inside = (x2 >= -1.0 && x2 <= 1.0);

        if (x1_inside && x2_inside)
        {
            return std::nullopt;
        }
        if (x1_inside)
        {
            x = x1;
        }
        else if (x2_inside)
        {
            x = x2;
        }
        else
        {
            return std::nullopt;
        }
    }

    return QuadraticRoot{
        .ut    = tm + x * dt,
        .df_dt = (2.0 * q * x + r) / dt,
    };
}

std::optional<astro::Instant> RootFinder::search(
    const SearchFunction& func,
    const astro::Instant& start,
    const astro::Instant& end,
    f64 tolerance_seconds)
{
    constexpr i32 kMaxIterations = 20;

    const f64 dt_days = std::abs(tolerance_seconds / astro_constants::kSecondsPerDay);

    astro::Instant t1 = start;
    astro::Instant t2 = end;
    f64 f1 = func(t1);
    f64 f2 = func(t2);
    f64 fmid = 0.0;
    bool calc_fmid = true;

    for (i32 iter = 1; iter <= kMaxIterations; ++iter)
    {
        const f64 dt = (t2.tt() - t1.tt()) / 2.0;
        const astro::Instant tmid = t1.add_days(dt);
        if (std::abs(dt) < dt_days)
        {
            return tmid;
        }

        if (calc_fmid)
        {
            fmid = func(tmid);
        }
        else
        {
            // fmid already holds the value at the recentred midpoint
            calc_fmid = true;
        }

        if (const auto q = quad_interp(tmid.ut(), t2.ut() - tmid.ut(), f1, fmid, f2))
        {
            const astro::Instant tq(q->ut);
            const f64 fq = func(tq);
            if (q->df_dt != 0.0)
            {
                f64 dt_guess = std::abs(fq / q->df_dt);
                if (dt_guess < dt_days)
                {
                    return tq;
                }

                // Try a tighter window centred on the interpolated root
                dt_guess *= 1.2;
                if (dt_guess < dt / 10.0)
                {
                    const astro::Instant tleft = tq.add_days(-dt_guess);
                    const astro::Instant tright = tq.add_days(+dt_guess);
                    if ((tleft.ut() - t1.ut()) * (tleft.ut() - t2.ut()) < 0.0
                        && (tright.ut() - t1.ut()) * (tright.ut() - t2.ut()) < 0.0)
                    {
                        const f64 fleft = func(tleft);
                        const f64 fright = func(tright);
                        if (fleft < 0.0 && fright >= 0.0)
                        {
                            ALM_CORE_TRACE("RootFinder: iteration {} narrowed to +/- {} days", iter, dt_guess);
                            f1 = fleft;
                            f2 = fright;
                            t1 = tleft;
                            t2 = tright;
                            fmid = fq;
                            calc_fmid = false;
                            continue;
                        }
                    }
                }
            }
        }

        // Bisection: keep the half where the function goes from negative to non-negative
        if (f1 < 0.0 && fmid >= 0.0)
        {
            t2 = tmid;
            f2 = fmid;
            continue;
        }

        if (fmid < 0.0 && f2 >= 0.0)
        {
            t1 = tmid;
            f1 = fmid;
            continue;
        }

        // No ascending crossing, or more than one crossing in the window
        return std::nullopt;
    }

    ALM_CORE_ERROR("RootFinder: no convergence after {} iterations", kMaxIterations);
    throw core::NoConvergeError("Excessive iteration in search");
}

} // namespace almanac::search
