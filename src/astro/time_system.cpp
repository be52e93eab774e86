/// @file time_system.cpp
/// @brief Implementation of astronomical time utilities and Instant.

#include "astro/time_system.hpp"

#include "astro/earth_orientation.hpp"
#include "core/error.hpp"
#include "core/logger.hpp"

#include <array>
#include <chrono>
#include <cmath>
#include <mutex>

namespace almanac::astro
{

namespace
{
    struct DeltaTEntry
    {
        f64 mjd;
        f64 delta_t;   // seconds
    };

    // Historical values (1500s onward) and long-range predictions, keyed by
    // Modified Julian Date.
    constexpr std::array<DeltaTEntry, 90> kDeltaTTable{{
        {-72638.0, 38.0},
        {-65333.0, 26.0},
        {-58028.0, 21.0},
        {-50724.0, 21.1},
        {-43419.0, 13.5},
        {-39766.0, 13.7},
        {-36114.0, 14.8},
        {-32461.0, 15.7},
        {-28809.0, 15.6},
        {-25156.0, 13.3},
        {-21504.0, 12.6},
        {-17852.0, 11.2},
        {-14200.0, 11.13},
        {-10547.0, 7.95},
        {-6895.0, 6.22},
        {-3242.0, 6.55},
        {-1416.0, 7.26},
        {410.0, 7.35},
        {2237.0, 5.92},
        {4063.0, 1.04},
        {5889.0, -3.19},
        {7715.0, -5.36},
        {9542.0, -5.74},
        {11368.0, -5.86},
        {13194.0, -6.41},
        {15020.0, -2.7},
        {16846.0, 3.92},
        {18672.0, 10.38},
        {20498.0, 17.19},
        {22324.0, 21.41},
        {24151.0, 23.63},
        {25977.0, 24.02},
        {27803.0, 23.91},
        {29629.0, 24.35},
        {31456.0, 26.76},
        {33282.0, 29.15},
        {35108.0, 31.07},
        {36934.0, 33.15},
        {38761.0, 35.738},
        {40587.0, 40.182},
        {42413.0, 45.477},
        {44239.0, 50.54},
        {44605.0, 51.3808},
        {44970.0, 52.1668},
        {45335.0, 52.9565},
        {45700.0, 53.7882},
        {46066.0, 54.3427},
        {46431.0, 54.8712},
        {46796.0, 55.3222},
        {47161.0, 55.8197},
        {47527.0, 56.3},
        {47892.0, 56.8553},
        {48257.0, 57.5653},
        {48622.0, 58.3092},
        {48988.0, 59.1218},
        {49353.0, 59.9845},
        {49718.0, 60.7853},
        {50083.0, 61.6287},
        {50449.0, 62.295},
        {50814.0, 62.9659},
        {51179.0, 63.4673},
        {51544.0, 63.8285},
        {51910.0, 64.0908},
        {52275.0, 64.2998},
        {52640.0, 64.4734},
        {53005.0, 64.5736},
        {53371.0, 64.6876},
        {53736.0, 64.8452},
        {54101.0, 65.1464},
        {54466.0, 65.4573},
        {54832.0, 65.7768},
        {55197.0, 66.0699},
        {55562.0, 66.3246},
        {55927.0, 66.603},
        {56293.0, 66.9069},
        {56658.0, 67.281},
        {57023.0, 67.6439},
        {57388.0, 68.1024},
        {57754.0, 68.5927},
        {58119.0, 68.9676},
        {58484.0, 69.2201},
        {58849.0, 69.87},
        {59214.0, 70.39},
        {59580.0, 70.91},
        {59945.0, 71.4},
        {60310.0, 71.88},
        {60675.0, 72.36},
        {61041.0, 72.83},
        {61406.0, 73.32},
        {61680.0, 73.66},
    }};
}

// -----------------------------------------------------------------
// Julian Date (Meeus, Astronomical Algorithms Ch. 7)
// -----------------------------------------------------------------

f64 TimeSystem::to_julian_date(const DateTime& dt)
{
    i32 y = dt.year;
    i32 m = dt.month;

    // January and February count as months 13 and 14 of the previous year
    if (m <= 2)
    {
        y -= 1;
        m += 12;
    }

    const i32 a = y / 100;
    const i32 b = 2 - a + (a / 4);

    const f64 day_fraction = (static_cast<f64>(dt.hour)
                            + static_cast<f64>(dt.minute) / 60.0
                            + dt.second / 3600.0) / 24.0;

    return std::floor(365.25 * static_cast<f64>(y + 4716))
         + std::floor(30.6001 * static_cast<f64>(m + 1))
         + static_cast<f64>(dt.day)
         + day_fraction
         + static_cast<f64>(b)
         - 1524.5;
}

DateTime TimeSystem::from_julian_date(f64 jd)
{
    const f64 jd_plus = jd + 0.5;
    const i32 z = static_cast<i32>(std::floor(jd_plus));
    const f64 f = jd_plus - static_cast<f64>(z);

    // Proleptic Gregorian throughout, matching to_julian_date
    const i32 alpha = static_cast<i32>(std::floor(
        (static_cast<f64>(z) - 1867216.25) / 36524.25));
    const i32 a = z + 1 + alpha - (alpha / 4);

    const i32 b = a + 1524;
    const i32 c = static_cast<i32>(std::floor((static_cast<f64>(b) - 122.1) / 365.25));
    const i32 d = static_cast<i32>(std::floor(365.25 * static_cast<f64>(c)));
    const i32 e = static_cast<i32>(std::floor(static_cast<f64>(b - d) / 30.6001));

    const f64 day_with_fraction = static_cast<f64>(b - d)
                                - std::floor(30.6001 * static_cast<f64>(e))
                                + f;

    const i32 day = static_cast<i32>(std::floor(day_with_fraction));
    const i32 month = (e < 14) ? (e - 1) : (e - 13);
    const i32 year = (month > 2) ? (c - 4716) : (c - 4715);

    // Split the day fraction into whole hours and minutes
    const f64 hours_total = (day_with_fraction - static_cast<f64>(day)) * 24.0;
    const i32 hour = static_cast<i32>(std::floor(hours_total));
    const f64 minutes_total = (hours_total - static_cast<f64>(hour)) * 60.0;
    const i32 minute = static_cast<i32>(std::floor(minutes_total));

    return DateTime{
        .year   = year,
        .month  = month,
        .day    = day,
        .hour   = hour,
        .minute = minute,
        .second = (minutes_total - static_cast<f64>(minute)) * 60.0,
    };
}

f64 TimeSystem::julian_centuries(f64 jd)
{
    return (jd - astro_constants::kJ2000) / astro_constants::kDaysPerCentury;
}

f64 TimeSystem::now_as_jd()
{
    using namespace std::chrono;

    const auto since_epoch = system_clock::now().time_since_epoch();
    const auto total_seconds = duration_cast<duration<f64>>(since_epoch).count();

    // Unix epoch (1970-01-01 00:00 UTC) as Julian Date
    constexpr f64 kUnixEpochJd = 2440587.5;

    return kUnixEpochJd + total_seconds / astro_constants::kSecondsPerDay;
}

// -----------------------------------------------------------------
// Delta-T = TT - UT
//
// Binary search for the table pair [c, c+1] with mjd[c] <= mjd <= mjd[c+1],
// then linear interpolation. Values are clamped at both ends of the table.
// -----------------------------------------------------------------

f64 TimeSystem::delta_t(f64 mjd)
{
    if (mjd <= kDeltaTTable.front().mjd)
    {
        return kDeltaTTable.front().delta_t;
    }
    if (mjd >= kDeltaTTable.back().mjd)
    {
        return kDeltaTTable.back().delta_t;
    }

    i32 lo = 0;
    i32 hi = static_cast<i32>(kDeltaTTable.size()) - 2;
    while (lo <= hi)
    {
        const i32 c = (lo + hi) / 2;
        const DeltaTEntry& left = kDeltaTTable[static_cast<std::size_t>(c)];
        const DeltaTEntry& right = kDeltaTTable[static_cast<std::size_t>(c) + 1];

        if (mjd < left.mjd)
        {
            hi = c - 1;
        }
        else if (mjd > right.mjd)
        {
            lo = c + 1;
        }
        else
        {
            const f64 frac = (mjd - left.mjd) / (right.mjd - left.mjd);
            return left.delta_t + frac * (right.delta_t - left.delta_t);
        }
    }

    ALM_CORE_ERROR("TimeSystem: delta-T lookup failed for MJD {}", mjd);
    throw core::InternalError("Could not find delta-T value");
}

f64 TimeSystem::to_dynamical(f64 ut)
{
    return ut + delta_t(ut + astro_constants::kJ2000InMjd) / astro_constants::kSecondsPerDay;
}

// -----------------------------------------------------------------
// Instant
// -----------------------------------------------------------------

struct Instant::TiltCell
{
    std::once_flag once;
    EarthTilt tilt{};
};

Instant::Instant(f64 ut)
    : m_ut(ut)
    , m_tt(TimeSystem::to_dynamical(ut))
    , m_tilt(std::make_shared<TiltCell>())
{
}

Instant Instant::from_utc(const DateTime& dt)
{
    return Instant(TimeSystem::to_julian_date(dt) - astro_constants::kJ2000);
}

Instant Instant::now()
{
    return Instant(TimeSystem::now_as_jd() - astro_constants::kJ2000);
}

Instant Instant::add_days(f64 days) const
{
    return Instant(m_ut + days);
}

DateTime Instant::to_utc() const
{
    return TimeSystem::from_julian_date(m_ut + astro_constants::kJ2000);
}

const EarthTilt& Instant::tilt() const
{
    std::call_once(m_tilt->once, [this]() { m_tilt->tilt = EarthOrientation::tilt(m_tt); });
    return m_tilt->tilt;
}

} // namespace almanac::astro
