/// @file earth_orientation.cpp
/// @brief Implementation of nutation, obliquity and sidereal time.

#include "astro/earth_orientation.hpp"

#include "astro/nutation_series.hpp"

#include <array>
#include <cmath>
#include <cstddef>

namespace almanac::astro
{

namespace
{
    /// @brief Polynomial in t (arcseconds) reduced to one revolution, in radians.
    f64 fundamental_argument(f64 constant, f64 rate, f64 t)
    {
        return std::fmod(constant + t * rate, astro_constants::kArcSecPerCircle)
             * astro_constants::kArcSecToRad;
    }
}

// -----------------------------------------------------------------
// IAU 2000B nutation
//
// Delaunay arguments (Simon et al. 1994), in arcseconds:
//   l  = 485868.249036  + 1717915923.2178 t
//   l' = 1287104.79305  +  129596581.0481 t
//   F  = 335779.526232  + 1739527262.8478 t
//   D  = 1072260.70369  + 1602961601.2090 t
//   Om = 450160.398036  -    6962890.5431 t
//
// The series sums are in 0.1 microarcseconds. Constant offsets
// -0.135 mas (psi) and +0.388 mas (eps) stand in for the planetary terms.
// -----------------------------------------------------------------

Nutation EarthOrientation::nutation(f64 tt)
{
    const f64 t = tt / astro_constants::kDaysPerCentury;

    const std::array<f64, 5> args{
        fundamental_argument(485868.249036, 1717915923.2178, t),
        fundamental_argument(1287104.79305, 129596581.0481, t),
        fundamental_argument(335779.526232, 1739527262.8478, t),
        fundamental_argument(1072260.70369, 1602961601.2090, t),
        fundamental_argument(450160.398036, -6962890.5431, t),
    };

    f64 dp = 0.0;
    f64 de = 0.0;
    for (const NutationTerm& term : nutation_terms())
    {
        f64 arg = 0.0;
        for (std::size_t k = 0; k < args.size(); ++k)
        {
            arg += static_cast<f64>(term.multipliers[k]) * args[k];
        }

        const f64 sarg = std::sin(arg);
        const f64 carg = std::cos(arg);
        dp += (term.ps + term.pst * t) * sarg + term.pc * carg;
        de += (term.ec + term.ect * t) * carg + term.es * sarg;
    }

    return Nutation{
        .dpsi = -0.000135 + dp * 1.0e-7,
        .deps = +0.000388 + de * 1.0e-7,
    };
}

// -----------------------------------------------------------------
// Mean obliquity (IAU 2006, arcseconds)
//
// eps0 = 84381.406 - 46.836769 t - 0.0001831 t^2 + 0.00200340 t^3
//      - 0.000000576 t^4 - 0.0000000434 t^5
// -----------------------------------------------------------------

f64 EarthOrientation::mean_obliquity(f64 tt)
{
    const f64 t = tt / astro_constants::kDaysPerCentury;
    const f64 asec =
        ((((-0.0000000434 * t
            - 0.000000576) * t
            + 0.00200340) * t
            - 0.0001831) * t
            - 46.836769) * t + 84381.406;
    return asec / 3600.0;
}

EarthTilt EarthOrientation::tilt(f64 tt)
{
    const Nutation nut = nutation(tt);
    const f64 mobl = mean_obliquity(tt);

    return EarthTilt{
        .tt                    = tt,
        .dpsi                  = nut.dpsi,
        .deps                  = nut.deps,
        .mean_obliquity        = mobl,
        .true_obliquity        = mobl + nut.deps / 3600.0,
        .equation_of_equinoxes = nut.dpsi * std::cos(mobl * astro_constants::kDegToRad) / 15.0,
    };
}

// -----------------------------------------------------------------
// Earth Rotation Angle (IERS Conventions 2003)
//
// theta = 2pi (0.7790572732640 + 1.00273781191135448 Du)
// The integer day is split off first to keep precision.
// -----------------------------------------------------------------

f64 EarthOrientation::earth_rotation_angle(f64 ut)
{
    const f64 thet1 = 0.7790572732640 + 0.00273781191135448 * ut;
    const f64 thet3 = std::fmod(ut, 1.0);
    f64 theta = 360.0 * std::fmod(thet1 + thet3, 1.0);
    if (theta < 0.0)
    {
        theta += 360.0;
    }
    return theta;
}

// -----------------------------------------------------------------
// Greenwich apparent sidereal time
//
// GAST = ERA + (EO polynomial in arcseconds) + equation of the equinoxes
// -----------------------------------------------------------------

f64 EarthOrientation::sidereal_time(const Instant& time)
{
    const f64 t = time.tt() / astro_constants::kDaysPerCentury;
    const f64 eqeq = 15.0 * time.tilt().equation_of_equinoxes;
    const f64 theta = earth_rotation_angle(time.ut());

    const f64 st = eqeq + 0.014506 +
        ((((-0.0000000368 * t
            - 0.000029956) * t
            - 0.00000044) * t
            + 1.3915817) * t
            + 4612.156534) * t;

    f64 gst = std::fmod(st / 3600.0 + theta, 360.0) / 15.0;
    if (gst < 0.0)
    {
        gst += 24.0;
    }
    return gst;
}

} // namespace almanac::astro
