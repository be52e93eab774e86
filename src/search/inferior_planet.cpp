/// @file inferior_planet.cpp
/// @brief Implementation of the maximum elongation and peak magnitude searches.

#include "search/inferior_planet.hpp"

#include "astro/coordinates.hpp"
#include "core/error.hpp"
#include "core/logger.hpp"
#include "search/relative_longitude.hpp"

namespace almanac::search
{

using ephemeris::Body;

// -----------------------------------------------------------------
// Both events happen while the heliocentric longitude of the planet
// relative to the Earth, rlon = planet - Earth in (-180, 180], is
// inside [+s1, +s2] or [-s2, -s1]. Slopes have a cusp at rlon 0 and
// 180, so the root search only runs inside one of those windows:
//
//   -s1 <= rlon < s1      next window is [+s1, +s2]
//   rlon beyond +/-s2     next window is [-s2, -s1]
//   inside a window       back up a quarter synodic period first
// -----------------------------------------------------------------

InferiorPlanetSearch::Window InferiorPlanetSearch::select_window(
    Body body, const astro::Instant& start, f64 s1, f64 s2, bool inclusive_outer)
{
    const f64 plon = astro::SolarGeometry::ecliptic_longitude(body, start);
    const f64 elon = astro::SolarGeometry::ecliptic_longitude(Body::Earth, start);
    const f64 rlon = astro::Coordinates::longitude_offset(plon - elon);

    const bool beyond_outer = inclusive_outer ? (rlon >= s2) : (rlon > s2);

    if (rlon >= -s1 && rlon < s1)
    {
        return Window{.adjust_days = 0.0, .rlon_lo = s1, .rlon_hi = s2};
    }
    if (beyond_outer || rlon < -s2)
    {
        return Window{.adjust_days = 0.0, .rlon_lo = -s2, .rlon_hi = -s1};
    }

    const f64 adjust = -ephemeris::Bodies::synodic_period(body) / 4.0;
    if (rlon >= 0.0)
    {
        return Window{.adjust_days = adjust, .rlon_lo = s1, .rlon_hi = s2};
    }
    return Window{.adjust_days = adjust, .rlon_lo = -s2, .rlon_hi = -s1};
}

InferiorPlanetSearch::Bracket InferiorPlanetSearch::bracket(
    Body body, const astro::Instant& start, const Window& window, const SearchFunction& slope)
{
    const astro::Instant t1 = RelativeLongitudeSearch::search(
        body, window.rlon_lo, start.add_days(window.adjust_days));
    const astro::Instant t2 = RelativeLongitudeSearch::search(body, window.rlon_hi, t1);

    if (slope(t1) >= 0.0 || slope(t2) <= 0.0)
    {
        ALM_ERROR("InferiorPlanetSearch: window [{}, {}] does not bracket an extremum for {}",
                  window.rlon_lo, window.rlon_hi, ephemeris::body_name(body));
        throw core::InternalError("Extremum not bracketed");
    }
    return Bracket{.t1 = t1, .t2 = t2};
}

std::optional<astro::ElongationEvent> InferiorPlanetSearch::max_elongation(
    Body body,
    const astro::Instant& start)
{
    f64 s1 = 0.0;
    f64 s2 = 0.0;
    switch (body)
    {
        case Body::Mercury:
            s1 = 50.0;
            s2 = 85.0;
            break;
        case Body::Venus:
            s1 = 40.0;
            s2 = 50.0;
            break;
        default:
            ALM_ERROR("InferiorPlanetSearch: {} has no maximum elongation", ephemeris::body_name(body));
            throw core::InvalidBodyError();
    }

    // Negative slope of the elongation: ascending root is the maximum
    const SearchFunction neg_elong_slope = [body](const astro::Instant& t)
    {
        constexpr f64 kDt = 0.1;
        const f64 e1 = astro::SolarGeometry::angle_from_sun(body, t.add_days(-kDt / 2.0));
        const f64 e2 = astro::SolarGeometry::angle_from_sun(body, t.add_days(+kDt / 2.0));
        return (e1 - e2) / kDt;
    };

    astro::Instant search_start = start;
    for (i32 pass = 0; pass < 2; ++pass)
    {
        const Window window = select_window(body, search_start, s1, s2, false);
        const Bracket range = bracket(body, search_start, window, neg_elong_slope);

        const std::optional<astro::Instant> tx = RootFinder::search(neg_elong_slope, range.t1, range.t2, 10.0);
        if (!tx)
        {
            return std::nullopt;
        }
        if (tx->tt() >= search_start.tt())
        {
            return astro::SolarGeometry::elongation(body, *tx);
        }

        // Event already in the past: the next window starts after t2
        search_start = range.t2.add_days(1.0);
    }

    ALM_WARN("InferiorPlanetSearch: no maximum elongation of {} found", ephemeris::body_name(body));
    return std::nullopt;
}

astro::IlluminationInfo InferiorPlanetSearch::peak_magnitude(
    Body body,
    const astro::Instant& start)
{
    if (body != Body::Venus)
    {
        ALM_ERROR("InferiorPlanetSearch: peak magnitude is only supported for Venus");
        throw core::InvalidBodyError();
    }

    constexpr f64 kS1 = 10.0;
    constexpr f64 kS2 = 30.0;

    // Magnitude decreases while brightening, so its slope ascends through peak brightness
    const SearchFunction mag_slope = [body](const astro::Instant& t)
    {
        constexpr f64 kDt = 0.01;
        const astro::IlluminationInfo y1 = astro::Illumination::compute(body, t.add_days(-kDt / 2.0));
        const astro::IlluminationInfo y2 = astro::Illumination::compute(body, t.add_days(+kDt / 2.0));
        return (y2.magnitude - y1.magnitude) / kDt;
    };

    astro::Instant search_start = start;
    for (i32 pass = 0; pass < 2; ++pass)
    {
        const Window window = select_window(body, search_start, kS1, kS2, true);
        const Bracket range = bracket(body, search_start, window, mag_slope);

        const std::optional<astro::Instant> tx = RootFinder::search(mag_slope, range.t1, range.t2, 10.0);
        if (!tx)
        {
            ALM_ERROR("InferiorPlanetSearch: peak magnitude not found inside its bracket");
            throw core::InternalError("Peak magnitude not found");
        }
        if (tx->tt() >= search_start.tt())
        {
            return astro::Illumination::compute(body, *tx);
        }

        search_start = range.t2.add_days(1.0);
    }

    ALM_ERROR("InferiorPlanetSearch: peak magnitude not found in two passes");
    throw core::InternalError("Peak magnitude not found");
}

} // namespace almanac::search
