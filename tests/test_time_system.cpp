/// @file test_time_system.cpp
/// @brief Unit tests for almanac::astro::TimeSystem and Instant.
///
/// Verifies Julian Date conversion (Meeus algorithm), the delta-T table,
/// and the UT/TT pair carried by Instant.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "astro/earth_orientation.hpp"
#include "astro/time_system.hpp"
#include "core/types.hpp"

#include <cmath>
#include <thread>
#include <vector>

using namespace almanac;
using namespace almanac::astro;

// =================================================================
// Helper: approximate equality for floating-point comparisons
// =================================================================

static constexpr f64 kJdTolerance     = 1e-6;   // ~0.086 seconds
static constexpr f64 kSecondTolerance = 1.0;     // 1 second (for round-trip)

// =================================================================
// Julian Date conversion tests
// =================================================================

TEST_CASE("J2000.0 epoch gives JD 2451545.0")
{
    const DateTime j2000 = {
        .year   = 2000,
        .month  = 1,
        .day    = 1,
        .hour   = 12,
        .minute = 0,
        .second = 0.0,
    };

    const f64 jd = TimeSystem::to_julian_date(j2000);
    CHECK(jd == doctest::Approx(2451545.0).epsilon(kJdTolerance));
}

TEST_CASE("Known date: 1999-01-01 00:00 UTC -> JD 2451179.5")
{
    const DateTime dt = {
        .year   = 1999,
        .month  = 1,
        .day    = 1,
        .hour   = 0,
        .minute = 0,
        .second = 0.0,
    };

    const f64 jd = TimeSystem::to_julian_date(dt);
    CHECK(jd == doctest::Approx(2451179.5).epsilon(kJdTolerance));
}

TEST_CASE("Known date: 2024-06-15 22:30:00 UTC")
{
    // Reference value from USNO Julian Date converter
    const DateTime dt = {
        .year   = 2024,
        .month  = 6,
        .day    = 15,
        .hour   = 22,
        .minute = 30,
        .second = 0.0,
    };

    const f64 jd = TimeSystem::to_julian_date(dt);
    // Expected: JD 2460476.4375
    CHECK(jd == doctest::Approx(2460476.4375).epsilon(kJdTolerance));
}

TEST_CASE("Historical date: Sputnik launch 1957-10-04 19:28:34 UTC")
{
    const DateTime dt = {
        .year   = 1957,
        .month  = 10,
        .day    = 4,
        .hour   = 19,
        .minute = 28,
        .second = 34.0,
    };

    const f64 jd = TimeSystem::to_julian_date(dt);
    // Expected: JD 2436116.3115... (approximately)
    CHECK(jd == doctest::Approx(2436116.31150).epsilon(1e-4));
}

// =================================================================
// Round-trip: DateTime -> JD -> DateTime
// =================================================================

TEST_CASE("Round-trip: DateTime -> JD -> DateTime preserves values")
{
    const DateTime original = {
        .year   = 2024,
        .month  = 3,
        .day    = 15,
        .hour   = 14,
        .minute = 30,
        .second = 45.0,
    };

    const f64 jd = TimeSystem::to_julian_date(original);
    const DateTime result = TimeSystem::from_julian_date(jd);

    CHECK(result.year   == original.year);
    CHECK(result.month  == original.month);
    CHECK(result.day    == original.day);
    CHECK(result.hour   == original.hour);
    CHECK(result.minute == original.minute);
    CHECK(result.second == doctest::Approx(original.second).epsilon(kSecondTolerance));
}

TEST_CASE("Round-trip: J2000.0 epoch")
{
    const DateTime original = {
        .year   = 2000,
        .month  = 1,
        .day    = 1,
        .hour   = 12,
        .minute = 0,
        .second = 0.0,
    };

    const f64 jd = TimeSystem::to_julian_date(original);
    const DateTime result = TimeSystem::from_julian_date(jd);

    CHECK(result.year   == 2000);
    CHECK(result.month  == 1);
    CHECK(result.day    == 1);
    CHECK(result.hour   == 12);
    CHECK(result.minute == 0);
    CHECK(result.second == doctest::Approx(0.0).epsilon(kSecondTolerance));
}

TEST_CASE("Round-trip: January date (month <= 2 branch)")
{
    const DateTime original = {
        .year   = 2025,
        .month  = 2,
        .day    = 14,
        .hour   = 8,
        .minute = 15,
        .second = 30.0,
    };

    const f64 jd = TimeSystem::to_julian_date(original);
    const DateTime result = TimeSystem::from_julian_date(jd);

    CHECK(result.year   == original.year);
    CHECK(result.month  == original.month);
    CHECK(result.day    == original.day);
    CHECK(result.hour   == original.hour);
    CHECK(result.minute == original.minute);
    CHECK(result.second == doctest::Approx(original.second).epsilon(kSecondTolerance));
}

TEST_CASE("Round-trip: dates before the Gregorian reform stay proleptic Gregorian")
{
    for (const i32 year : {1000, 1500, 1582})
    {
        CAPTURE(year);
        const DateTime original = {
            .year   = year,
            .month  = 3,
            .day    = 1,
            .hour   = 6,
            .minute = 0,
            .second = 0.0,
        };

        const DateTime result = Instant::from_utc(original).to_utc();
        CHECK(result.year   == original.year);
        CHECK(result.month  == original.month);
        CHECK(result.day    == original.day);
        CHECK(result.hour   == original.hour);
    }
}

TEST_CASE("Proleptic Gregorian JD of 1582-10-04")
{
    // The Julian-calendar 1582-10-04 is JD 2299159.5, ten days after the Gregorian one
    const f64 jd = TimeSystem::to_julian_date(DateTime{.year = 1582, .month = 10, .day = 4});
    CHECK(jd == doctest::Approx(2299149.5).epsilon(kJdTolerance));
}

// =================================================================
// Julian centuries
// =================================================================

TEST_CASE("Julian centuries at J2000.0 is 0.0")
{
    const f64 t = TimeSystem::julian_centuries(astro_constants::kJ2000);
    CHECK(t == doctest::Approx(0.0).epsilon(1e-12));
}

TEST_CASE("Julian centuries at J2100.0")
{
    // J2100.0 = JD 2488070.0 (2100-01-01 12:00 UTC, ~1.0 century)
    const DateTime dt = {
        .year   = 2100,
        .month  = 1,
        .day    = 1,
        .hour   = 12,
        .minute = 0,
        .second = 0.0,
    };
    const f64 jd = TimeSystem::to_julian_date(dt);
    const f64 t = TimeSystem::julian_centuries(jd);
    CHECK(t == doctest::Approx(1.0).epsilon(0.001));
}

// =================================================================
// Delta-T
// =================================================================

TEST_CASE("Delta-T at J2000.0 is about 64 seconds")
{
    const f64 dt = TimeSystem::delta_t(astro_constants::kJ2000InMjd);
    CHECK(dt == doctest::Approx(63.83).epsilon(1e-3));
}

TEST_CASE("Delta-T matches table breakpoints exactly")
{
    CHECK(TimeSystem::delta_t(51544.0) == doctest::Approx(63.8285).epsilon(1e-12));
    CHECK(TimeSystem::delta_t(58849.0) == doctest::Approx(69.87).epsilon(1e-12));
}

TEST_CASE("Delta-T interpolates linearly between breakpoints")
{
    // Halfway between {51544, 63.8285} and {51910, 64.0908}
    const f64 dt = TimeSystem::delta_t(51727.0);
    CHECK(dt == doctest::Approx((63.8285 + 64.0908) / 2.0).epsilon(1e-12));
}

TEST_CASE("Delta-T is held constant outside the table")
{
    CHECK(TimeSystem::delta_t(-1.0e6) == doctest::Approx(38.0));
    CHECK(TimeSystem::delta_t(-72638.0) == doctest::Approx(38.0));
    CHECK(TimeSystem::delta_t(61680.0) == doctest::Approx(73.66));
    CHECK(TimeSystem::delta_t(1.0e6) == doctest::Approx(73.66));
}

TEST_CASE("to_dynamical is non-decreasing across the table")
{
    f64 prev_tt = TimeSystem::to_dynamical(-130000.0);
    for (f64 ut = -129900.0; ut < 15000.0; ut += 100.0)
    {
        const f64 tt = TimeSystem::to_dynamical(ut);
        CHECK(tt >= prev_tt);
        prev_tt = tt;
    }
}

// =================================================================
// Instant
// =================================================================

TEST_CASE("Instant from UTC at J2000.0 has ut = 0")
{
    const Instant t = Instant::from_utc(DateTime{
        .year = 2000, .month = 1, .day = 1, .hour = 12, .minute = 0, .second = 0.0});

    CHECK(t.ut() == doctest::Approx(0.0).epsilon(kJdTolerance));
    CHECK((t.tt() - t.ut()) * astro_constants::kSecondsPerDay
          == doctest::Approx(TimeSystem::delta_t(astro_constants::kJ2000InMjd)).epsilon(1e-6));
}

TEST_CASE("Instant add_days recomputes TT")
{
    const Instant t0(0.0);
    const Instant t1 = t0.add_days(7305.0);   // ~2020

    CHECK(t1.ut() == doctest::Approx(7305.0));
    CHECK(t1.tt() == doctest::Approx(TimeSystem::to_dynamical(7305.0)).epsilon(1e-15));
    CHECK(t1.tt() - t1.ut() > t0.tt() - t0.ut());
}

TEST_CASE("Instant to_utc round-trip")
{
    const DateTime original = {
        .year   = 2021,
        .month  = 11,
        .day    = 19,
        .hour   = 9,
        .minute = 3,
        .second = 12.0,
    };

    const DateTime result = Instant::from_utc(original).to_utc();
    CHECK(result.year   == original.year);
    CHECK(result.month  == original.month);
    CHECK(result.day    == original.day);
    CHECK(result.hour   == original.hour);
    CHECK(result.minute == original.minute);
    CHECK(result.second == doctest::Approx(original.second).epsilon(kSecondTolerance));
}

TEST_CASE("Instant tilt is computed once and shared by copies")
{
    const Instant t(1234.5);
    const EarthTilt& first = t.tilt();
    const EarthTilt& second = t.tilt();
    CHECK(&first == &second);

    const Instant copy = t;
    CHECK(&copy.tilt() == &first);

    const EarthTilt direct = EarthOrientation::tilt(t.tt());
    CHECK(first.tt == doctest::Approx(t.tt()));
    CHECK(first.dpsi == doctest::Approx(direct.dpsi).epsilon(1e-15));
    CHECK(first.true_obliquity == doctest::Approx(direct.true_obliquity).epsilon(1e-15));
}

TEST_CASE("Instant tilt is safe to request from several threads")
{
    const Instant t(-2000.25);
    std::vector<const EarthTilt*> seen(4, nullptr);
    std::vector<std::thread> workers;

    for (std::size_t i = 0; i < seen.size(); ++i)
    {
        workers.emplace_back([&t, &seen, i]() { seen[i] = &t.tilt(); });
    }
    for (auto& w : workers)
    {
        w.join();
    }

    for (const EarthTilt* p : seen)
    {
        CHECK(p == seen.front());
    }
}

// =================================================================
// now_as_jd sanity check
// =================================================================

TEST_CASE("now_as_jd returns a reasonable Julian Date")
{
    const f64 jd = TimeSystem::now_as_jd();

    // Should be after 2020-01-01 (JD ~2458849.5) and before 2100
    CHECK(jd > 2458849.5);
    CHECK(jd < 2488070.0);
}
