/// @file lunar_apsis.cpp
/// @brief Implementation of the lunar apsis search.

#include "search/lunar_apsis.hpp"

#include "core/error.hpp"
#include "core/logger.hpp"
#include "ephemeris/lunar_theory.hpp"
#include "search/root_finder.hpp"

#include <optional>
#include <stdexcept>

namespace almanac::search
{

namespace
{
    f64 moon_distance(const astro::Instant& time)
    {
        return ephemeris::LunarTheory::compute(time.tt()).distance_au;
    }

    /// @brief Rate of change of the Earth-Moon distance (AU/day), times @p direction.
    f64 distance_slope(f64 direction, const astro::Instant& time)
    {
        constexpr f64 kDt = 0.001;
        const f64 dist1 = moon_distance(time.add_days(-kDt / 2.0));
        const f64 dist2 = moon_distance(time.add_days(+kDt / 2.0));
        return direction * (dist2 - dist1) / kDt;
    }
}

// -----------------------------------------------------------------
// Step forward 5 days at a time until the distance slope changes
// sign, then refine: ascending slope is perigee, descending apogee.
// -----------------------------------------------------------------

Apsis LunarApsisSearch::search(const astro::Instant& start)
{
    constexpr f64 kIncrement = 5.0;

    astro::Instant t1 = start;
    f64 m1 = distance_slope(+1.0, t1);

    for (i32 iter = 0; iter * kIncrement < 2.0 * astro_constants::kMeanSynodicMonth; ++iter)
    {
        const astro::Instant t2 = t1.add_days(kIncrement);
        const f64 m2 = distance_slope(+1.0, t2);

        if (m1 * m2 <= 0.0)
        {
            f64 direction = 0.0;
            ApsisKind kind = ApsisKind::Invalid;
            if (m1 < 0.0 || m2 > 0.0)
            {
                direction = +1.0;
                kind = ApsisKind::Pericenter;
            }
            else if (m1 > 0.0 || m2 < 0.0)
            {
                direction = -1.0;
                kind = ApsisKind::Apocenter;
            }
            else
            {
                ALM_ERROR("LunarApsisSearch: both distance slopes are zero");
                throw core::InternalError("Both lunar distance slopes are zero");
            }

            const SearchFunction slope = [direction](const astro::Instant& t)
            {
                return distance_slope(direction, t);
            };
            const std::optional<astro::Instant> apsis_time = RootFinder::search(slope, t1, t2, 1.0);
            if (!apsis_time)
            {
                ALM_ERROR("LunarApsisSearch: bracketed apsis could not be refined");
                throw core::InternalError("Lunar apsis search failed");
            }

            const f64 dist = moon_distance(*apsis_time);
            return Apsis{
                .time    = *apsis_time,
                .kind    = kind,
                .dist_au = dist,
                .dist_km = dist * astro_constants::kKmPerAu,
            };
        }

        t1 = t2;
        m1 = m2;
    }

    ALM_ERROR("LunarApsisSearch: no apsis within two synodic months");
    throw core::InternalError("No lunar apsis found");
}

Apsis LunarApsisSearch::next(const Apsis& previous)
{
    if (previous.kind != ApsisKind::Pericenter && previous.kind != ApsisKind::Apocenter)
    {
        ALM_ERROR("LunarApsisSearch: previous apsis has invalid kind {}", static_cast<i32>(previous.kind));
        throw std::invalid_argument("Apsis has an invalid kind");
    }

    // Perigee and apogee are always more than 11 days apart
    const Apsis next_apsis = search(previous.time.add_days(11.0));
    if (static_cast<i32>(next_apsis.kind) + static_cast<i32>(previous.kind) != 1)
    {
        ALM_ERROR("LunarApsisSearch: two consecutive apsides of the same kind");
        throw core::InternalError("Lunar apsides out of sequence");
    }
    return next_apsis;
}

} // namespace almanac::search
