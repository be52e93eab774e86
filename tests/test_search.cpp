/// @file test_search.cpp
/// @brief Unit tests for the event finders in almanac::search.
///
/// Reference times are UT days since J2000, checked against published
/// almanac values (USNO seasons, lunar phases, perigee/apogee tables).

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "astro/observer.hpp"
#include "astro/time_system.hpp"
#include "core/error.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "ephemeris/body.hpp"
#include "search/hour_angle.hpp"
#include "search/inferior_planet.hpp"
#include "search/lunar_apsis.hpp"
#include "search/moon_phase.hpp"
#include "search/relative_longitude.hpp"
#include "search/rise_set.hpp"
#include "search/seasons.hpp"

#include <cmath>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace almanac;
using namespace almanac::search;
using astro::DateTime;
using astro::GeoLocation;
using astro::Instant;
using ephemeris::Body;

// =================================================================
// Custom main: initialize logger before tests
// =================================================================

int main(int argc, char** argv)
{
    almanac::core::Logger::init(almanac::core::LoggerConfig{
        .file_path = "test_search.log",
        .level     = spdlog::level::debug,
        .console   = false,
    });
    const int result = doctest::Context(argc, argv).run();
    almanac::core::Logger::shutdown();
    return result;
}

// =================================================================
// Helpers
// =================================================================

static constexpr f64 kSecondDays = 1.0 / astro_constants::kSecondsPerDay;
static constexpr f64 kTightTol = 10.0 * kSecondDays;   // 1-second searches
static constexpr f64 kLooseTol = 0.001;                // 10-second searches on flat slopes

// 2000-01-01T00:00Z
static Instant new_year_2000()
{
    return Instant::from_utc(DateTime{.year = 2000, .month = 1, .day = 1, .hour = 0, .minute = 0, .second = 0.0});
}

static bool near_ut(const Instant& t, f64 expected_ut, f64 tol)
{
    return std::abs(t.ut() - expected_ut) < tol;
}

// =================================================================
// Hour angle
// =================================================================

TEST_CASE("Sun culminates near noon on the prime meridian")
{
    const HourAngleEvent evt = HourAngleSearch::search(Body::Sun, GeoLocation{}, 0.0, new_year_2000());

    CHECK(near_ut(evt.time, 0.0022991929250716636, kTightTol));
    CHECK(evt.hor.altitude == doctest::Approx(66.97417079717208).epsilon(1e-6));
    CHECK(evt.hor.azimuth == doctest::Approx(180.0).epsilon(1e-6));
}

TEST_CASE("Mars at hour angle 6 from Sydney")
{
    const GeoLocation sydney = {.latitude_deg = -33.0, .longitude_deg = 151.0, .height_m = 0.0};
    const HourAngleEvent evt = HourAngleSearch::search(Body::Mars, sydney, 6.0, new_year_2000());

    CHECK(near_ut(evt.time, -0.03037047961048058, kTightTol));
    CHECK(evt.hor.azimuth == doctest::Approx(258.87972045220425).epsilon(1e-6));
}

TEST_CASE("Hour angle search rejects bad input")
{
    CHECK_THROWS_AS((void)HourAngleSearch::search(Body::Earth, GeoLocation{}, 0.0, new_year_2000()),
                    core::EarthNotAllowedError);
    CHECK_THROWS_AS((void)HourAngleSearch::search(Body::Sun, GeoLocation{}, 24.0, new_year_2000()),
                    std::invalid_argument);
    CHECK_THROWS_AS((void)HourAngleSearch::search(Body::Sun, GeoLocation{}, -0.5, new_year_2000()),
                    std::invalid_argument);
}

// =================================================================
// Rise and set
// =================================================================

TEST_CASE("Sunrise and sunset on the equator")
{
    const auto rise = RiseSetSearch::search(Body::Sun, GeoLocation{}, Direction::Rise, new_year_2000(), 2.0);
    REQUIRE(rise.has_value());
    CHECK(near_ut(*rise, -0.2503054136280564, kTightTol));

    // Between 05:00 and 07:30 UTC
    const DateTime local = rise->to_utc();
    CHECK(local.day == 1);
    CHECK(local.hour >= 5);
    CHECK(local.hour <= 7);

    const auto set = RiseSetSearch::search(Body::Sun, GeoLocation{}, Direction::Set, new_year_2000(), 2.0);
    REQUIRE(set.has_value());
    CHECK(near_ut(*set, 0.2549028682569551, kTightTol));
    CHECK(set->ut() > rise->ut());
}

TEST_CASE("Moonrise and moonset")
{
    const GeoLocation observer = {.latitude_deg = 45.0, .longitude_deg = 10.0, .height_m = 100.0};

    const auto rise = RiseSetSearch::search(Body::Moon, observer, Direction::Rise, new_year_2000(), 3.0);
    REQUIRE(rise.has_value());
    CHECK(near_ut(*rise, -0.4248615511286903, kTightTol));

    const auto set = RiseSetSearch::search(Body::Moon, observer, Direction::Set, new_year_2000(), 3.0);
    REQUIRE(set.has_value());
    CHECK(near_ut(*set, 0.03044189990353683, kTightTol));
}

TEST_CASE("No sunrise during the polar night")
{
    const GeoLocation arctic = {.latitude_deg = 89.0, .longitude_deg = 0.0, .height_m = 0.0};
    CHECK_FALSE(RiseSetSearch::search(Body::Sun, arctic, Direction::Rise, new_year_2000(), 10.0).has_value());
}

TEST_CASE("The Earth does not rise")
{
    CHECK_THROWS_AS((void)RiseSetSearch::search(Body::Earth, GeoLocation{}, Direction::Rise, new_year_2000(), 1.0),
                    core::EarthNotAllowedError);
}

// =================================================================
// Seasons
// =================================================================

TEST_CASE("Equinoxes and solstices of 2000")
{
    const SeasonInfo s = SeasonSearch::seasons(2000);

    CHECK(near_ut(s.mar_equinox, 78.81616825076216, kTightTol));
    CHECK(near_ut(s.jun_solstice, 171.57476965813964, kTightTol));
    CHECK(near_ut(s.sep_equinox, 265.2277380143045, kTightTol));
    CHECK(near_ut(s.dec_solstice, 355.06794001042573, kTightTol));

    // USNO: 2000-03-20 07:35 UTC, within 2 minutes
    const Instant usno = Instant::from_utc(DateTime{.year = 2000, .month = 3, .day = 20, .hour = 7, .minute = 35, .second = 0.0});
    CHECK(std::abs(s.mar_equinox.ut() - usno.ut()) * 1440.0 < 2.0);
}

TEST_CASE("March equinox of 2024")
{
    CHECK(near_ut(SeasonSearch::seasons(2024).mar_equinox, 8844.629463460305, kTightTol));
}

TEST_CASE("Sun longitude outside the window is not found")
{
    const Instant june1 = Instant::from_utc(DateTime{.year = 2000, .month = 6, .day = 1, .hour = 0, .minute = 0, .second = 0.0});
    CHECK_FALSE(SeasonSearch::sun_longitude(90.0, june1, 4.0).has_value());
}

// =================================================================
// Lunar phases
// =================================================================

TEST_CASE("Full moon of January 2000")
{
    const auto full = MoonPhaseSearch::search_phase(180.0, new_year_2000(), 40.0);
    REQUIRE(full.has_value());
    CHECK(near_ut(*full, 19.695139289585068, kTightTol));
}

TEST_CASE("Moon phase beyond the limit is not found")
{
    CHECK_FALSE(MoonPhaseSearch::search_phase(180.0, new_year_2000(), 5.0).has_value());
}

TEST_CASE("Lunar quarters advance in sequence")
{
    constexpr f64 kExpected[] = {
        5.260006865701073, 13.065852881215797, 19.6951392895787, 26.831524541264947, 35.04446234803312,
    };

    MoonQuarter mq = MoonPhaseSearch::search_quarter(new_year_2000());
    CHECK(mq.quarter == 0);

    for (i32 i = 0; i < 5; ++i)
    {
        CAPTURE(i);
        CHECK(mq.quarter == i % 4);
        CHECK(near_ut(mq.time, kExpected[i], kTightTol));
        if (i < 4)
        {
            mq = MoonPhaseSearch::next_quarter(mq);
        }
    }
}

// =================================================================
// Lunar apsides
// =================================================================

TEST_CASE("Apogee and perigee alternate")
{
    struct Expected
    {
        ApsisKind kind;
        f64 ut;
        f64 dist_km;
    };

    constexpr Expected kExpected[] = {
        {ApsisKind::Apocenter, 3.0162428887209614, 406406.00680740067},
        {ApsisKind::Pericenter, 18.449114569321008, 359351.4162626812},
        {ApsisKind::Apocenter, 30.554458247670315, 405596.79295873124},
        {ApsisKind::Pericenter, 46.606189512005656, 364485.49710733903},
    };

    Apsis apsis = LunarApsisSearch::search(new_year_2000());
    for (std::size_t i = 0; i < std::size(kExpected); ++i)
    {
        CAPTURE(i);
        CHECK(apsis.kind == kExpected[i].kind);
        CHECK(near_ut(apsis.time, kExpected[i].ut, kTightTol));
        CHECK(apsis.dist_km == doctest::Approx(kExpected[i].dist_km).epsilon(1e-6));
        CHECK(apsis.dist_km == doctest::Approx(apsis.dist_au * astro_constants::kKmPerAu));

        const Apsis next = LunarApsisSearch::next(apsis);
        if (next.kind == ApsisKind::Pericenter)
        {
            CHECK(next.dist_km < apsis.dist_km);
        }
        else
        {
            CHECK(next.dist_km > apsis.dist_km);
        }
        apsis = next;
    }
}

TEST_CASE("Next apsis rejects an invalid kind")
{
    Apsis bad = LunarApsisSearch::search(new_year_2000());
    bad.kind = ApsisKind::Invalid;
    CHECK_THROWS_AS((void)LunarApsisSearch::next(bad), std::invalid_argument);

    core::Logger::get_search_logger()->flush();
    std::ifstream in("test_search.log");
    std::ostringstream ss;
    ss << in.rdbuf();
    CHECK(ss.str().find("LunarApsisSearch: previous apsis has invalid kind 2") != std::string::npos);
}

// =================================================================
// Relative longitude
// =================================================================

TEST_CASE("Mars opposition of 2001")
{
    const Instant opp = RelativeLongitudeSearch::search(Body::Mars, 0.0, new_year_2000());
    CHECK(near_ut(opp, 529.2376761266527, kTightTol));
}

TEST_CASE("Jupiter conjunction of 2000")
{
    const Instant conj = RelativeLongitudeSearch::search(Body::Jupiter, 180.0, new_year_2000());
    CHECK(near_ut(conj, 127.67618805342845, kTightTol));
}

TEST_CASE("Relative longitude is undefined for the Earth, Sun and Moon")
{
    CHECK_THROWS_AS((void)RelativeLongitudeSearch::search(Body::Earth, 0.0, new_year_2000()), core::EarthNotAllowedError);
    CHECK_THROWS_AS((void)RelativeLongitudeSearch::search(Body::Sun, 0.0, new_year_2000()), core::InvalidBodyError);
    CHECK_THROWS_AS((void)RelativeLongitudeSearch::search(Body::Moon, 0.0, new_year_2000()), core::InvalidBodyError);
}

// =================================================================
// Inferior planets
// =================================================================

TEST_CASE("Greatest eastern elongation of Mercury, February 2000")
{
    const auto evt = InferiorPlanetSearch::max_elongation(Body::Mercury, new_year_2000());
    REQUIRE(evt.has_value());
    CHECK(near_ut(evt->time, 44.55301092239077, kLooseTol));
    CHECK(evt->elongation == doctest::Approx(18.143712526773538).epsilon(1e-5));
    CHECK(evt->ecliptic_separation == doctest::Approx(18.119698931304583).epsilon(1e-5));
    CHECK(evt->visibility == astro::Visibility::Evening);
}

TEST_CASE("Greatest elongation of Venus, January 2001")
{
    const auto evt = InferiorPlanetSearch::max_elongation(Body::Venus, new_year_2000());
    REQUIRE(evt.has_value());
    CHECK(near_ut(evt->time, 381.7538431097265, kLooseTol));
    CHECK(evt->elongation == doctest::Approx(47.08657921896211).epsilon(1e-5));
    CHECK(evt->visibility == astro::Visibility::Evening);
}

TEST_CASE("Maximum elongation only for Mercury and Venus")
{
    CHECK_THROWS_AS((void)InferiorPlanetSearch::max_elongation(Body::Mars, new_year_2000()), core::InvalidBodyError);
}

TEST_CASE("Venus at greatest brilliancy, February 2001")
{
    const astro::IlluminationInfo peak = InferiorPlanetSearch::peak_magnitude(Body::Venus, new_year_2000());
    CHECK(near_ut(peak.time, 419.96668906656487, kLooseTol));
    CHECK(peak.magnitude == doctest::Approx(-4.839146497183437).epsilon(1e-5));
}

TEST_CASE("Peak magnitude only for Venus")
{
    CHECK_THROWS_AS((void)InferiorPlanetSearch::peak_magnitude(Body::Mercury, new_year_2000()), core::InvalidBodyError);
}
