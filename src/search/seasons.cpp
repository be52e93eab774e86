/// @file seasons.cpp
/// @brief Implementation of the solar longitude and season searches.

#include "search/seasons.hpp"

#include "astro/coordinates.hpp"
#include "astro/solar_geometry.hpp"
#include "core/error.hpp"
#include "core/logger.hpp"
#include "search/root_finder.hpp"

namespace almanac::search
{

std::optional<astro::Instant> SeasonSearch::sun_longitude(
    f64 target_lon,
    const astro::Instant& start,
    f64 limit_days)
{
    const SearchFunction sun_offset = [target_lon](const astro::Instant& t)
    {
        const astro::EclipticCoord ecl = astro::SolarGeometry::sun_position(t);
        return astro::Coordinates::longitude_offset(ecl.elon - target_lon);
    };

    return RootFinder::search(sun_offset, start, start.add_days(limit_days), 1.0);
}

astro::Instant SeasonSearch::find_change(f64 target_lon, i32 year, i32 month, i32 day)
{
    const astro::Instant start = astro::Instant::from_utc(astro::DateTime{
        .year = year, .month = month, .day = day, .hour = 0, .minute = 0, .second = 0.0});

    const std::optional<astro::Instant> time = sun_longitude(target_lon, start, 4.0);
    if (!time)
    {
        ALM_ERROR("SeasonSearch: Sun longitude {} not reached near {}-{:02}-{:02}",
                  target_lon, year, month, day);
        throw core::InternalError("Season change not found");
    }
    return *time;
}

// -----------------------------------------------------------------
// Each change of season falls within a few days of a fixed calendar
// date, so a 4-day window starting on that date always brackets it.
// -----------------------------------------------------------------

SeasonInfo SeasonSearch::seasons(i32 year)
{
    SeasonInfo info{
        .mar_equinox  = find_change(0.0, year, 3, 19),
        .jun_solstice = find_change(90.0, year, 6, 19),
        .sep_equinox  = find_change(180.0, year, 9, 21),
        .dec_solstice = find_change(270.0, year, 12, 20),
    };

    ALM_DEBUG("SeasonSearch: seasons for {} computed", year);
    return info;
}

} // namespace almanac::search
