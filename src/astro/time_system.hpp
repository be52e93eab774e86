#pragma once

/// @file time_system.hpp
/// @brief Astronomical time: Julian Date, delta-T, and the Instant time stamp.

#include "core/types.hpp"

#include <memory>

namespace almanac::astro
{
    struct EarthTilt;

    /// @brief Civil date/time representation (UTC).
    struct DateTime
    {
        i32 year;
        i32 month;
        i32 day;
        i32 hour;
        i32 minute;
        f64 second;
    };

    /// @brief Static utility class for astronomical time computations.
    ///
    /// Provides Julian Date conversion (Meeus algorithm, Astronomical Algorithms Ch. 7),
    /// the tabulated delta-T model (TT - UT), and system clock access.
    class TimeSystem
    {
    public:
        TimeSystem() = delete;

        /// @brief Convert civil date/time (UTC) to Julian Date.
        /// @param dt Civil date/time. Month in [1,12], day in [1,31].
        /// @return Julian Date as a double-precision floating-point number.
        [[nodiscard]] static f64 to_julian_date(const DateTime& dt);

        /// @brief Convert Julian Date back to civil date/time (UTC).
        /// @param jd Julian Date (must be positive).
        /// @return Corresponding civil date/time.
        [[nodiscard]] static DateTime from_julian_date(f64 jd);

        /// @brief Compute Julian centuries elapsed since J2000.0.
        /// @param jd Julian Date.
        /// @return T = (JD - 2451545.0) / 36525.0
        [[nodiscard]] static f64 julian_centuries(f64 jd);

        /// @brief Get current system time as a Julian Date.
        [[nodiscard]] static f64 now_as_jd();

        /// @brief TT - UT in seconds for a Modified Julian Date.
        ///
        /// Piecewise-linear interpolation of a table of historical and
        /// predicted values. Outside the table the end values are held constant.
        /// @throws core::InternalError if the table lookup fails to bracket @p mjd.
        [[nodiscard]] static f64 delta_t(f64 mjd);

        /// @brief Convert UT days since J2000 to TT days since J2000.
        [[nodiscard]] static f64 to_dynamical(f64 ut);
    };

    /// @brief A moment in time on both the rotational (UT) and dynamical (TT) scales.
    ///
    /// Both scales count days since 2000-01-01T12:00. UT is the independent
    /// value; TT is derived from it through TimeSystem::to_dynamical. Copies of
    /// an Instant share one lazily computed EarthTilt snapshot, which is
    /// computed at most once even when copies are used from several threads.
    class Instant
    {
    public:
        /// @brief Create an Instant from UT days since J2000.
        explicit Instant(f64 ut);

        /// @brief Create an Instant from a UTC calendar date.
        [[nodiscard]] static Instant from_utc(const DateTime& dt);

        /// @brief The current system clock time.
        [[nodiscard]] static Instant now();

        /// @brief A new Instant @p days later (negative for earlier); TT is recomputed.
        [[nodiscard]] Instant add_days(f64 days) const;

        /// @brief Calendar representation of the UT value.
        [[nodiscard]] DateTime to_utc() const;

        /// @brief Nutation and obliquity at this Instant (computed on first use).
        [[nodiscard]] const EarthTilt& tilt() const;

        [[nodiscard]] f64 ut() const { return m_ut; }
        [[nodiscard]] f64 tt() const { return m_tt; }

    private:
        struct TiltCell;

        f64 m_ut;
        f64 m_tt;
        std::shared_ptr<TiltCell> m_tilt;
    };

} // namespace almanac::astro
