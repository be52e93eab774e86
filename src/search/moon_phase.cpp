/// @file moon_phase.cpp
/// @brief Implementation of the lunar phase searches.

#include "search/moon_phase.hpp"

#include "astro/coordinates.hpp"
#include "astro/solar_geometry.hpp"
#include "core/error.hpp"
#include "core/logger.hpp"
#include "search/root_finder.hpp"

#include <algorithm>
#include <cmath>

namespace almanac::search
{

namespace
{
    f64 moon_offset(f64 target_lon, const astro::Instant& time)
    {
        return astro::Coordinates::longitude_offset(
            astro::SolarGeometry::moon_phase(time) - target_lon);
    }
}

// -----------------------------------------------------------------
// The true phase can run up to ~0.83 days from the mean-month
// prediction because of the eccentricity of the lunar orbit.
// Searching +/-0.9 days keeps a single root inside the window.
// -----------------------------------------------------------------

std::optional<astro::Instant> MoonPhaseSearch::search_phase(
    f64 target_lon,
    const astro::Instant& start,
    f64 limit_days)
{
    constexpr f64 kUncertainty = 0.9;

    f64 ya = moon_offset(target_lon, start);
    if (ya > 0.0)
    {
        ya -= 360.0;    // always search forward
    }

    const f64 est_dt = -(astro_constants::kMeanSynodicMonth * ya) / 360.0;
    const f64 dt1 = est_dt - kUncertainty;
    if (dt1 > limit_days)
    {
        return std::nullopt;
    }
    const f64 dt2 = std::min(limit_days, est_dt + kUncertainty);

    const SearchFunction func = [target_lon](const astro::Instant& t)
    {
        return moon_offset(target_lon, t);
    };
    return RootFinder::search(func, start.add_days(dt1), start.add_days(dt2), 1.0);
}

MoonQuarter MoonPhaseSearch::search_quarter(const astro::Instant& start)
{
    const f64 angle = astro::SolarGeometry::moon_phase(start);
    const i32 quarter = (1 + static_cast<i32>(std::floor(angle / 90.0))) % 4;

    const std::optional<astro::Instant> time = search_phase(90.0 * quarter, start, 10.0);
    if (!time)
    {
        ALM_ERROR("MoonPhaseSearch: quarter {} not found within 10 days", quarter);
        throw core::InternalError("Lunar quarter not found");
    }
    return MoonQuarter{.quarter = quarter, .time = *time};
}

MoonQuarter MoonPhaseSearch::next_quarter(const MoonQuarter& previous)
{
    // Consecutive quarters are always more than 6 days apart
    const MoonQuarter next = search_quarter(previous.time.add_days(6.0));
    if (next.quarter != (1 + previous.quarter) % 4)
    {
        ALM_ERROR("MoonPhaseSearch: expected quarter {} after {}, found {}",
                  (1 + previous.quarter) % 4, previous.quarter, next.quarter);
        throw core::InternalError("Lunar quarters out of sequence");
    }
    return next;
}

} // namespace almanac::search
