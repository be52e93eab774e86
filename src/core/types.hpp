#pragma once

/// @file types.hpp
/// @brief Precision aliases, glm vector types and astronomical constants.

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

#include <cstdint>

namespace almanac
{
    // Precision aliases
    using f64 = double;
    using u32 = uint32_t;
    using i32 = int32_t;

    // Vector types (double precision throughout)
    using Vec3d = glm::dvec3;
    using Mat3d = glm::dmat3;

    // Astronomical constants
    namespace astro_constants
    {
        constexpr f64 kPi          = glm::pi<f64>();
        constexpr f64 kTwoPi       = 2.0 * kPi;
        constexpr f64 kHalfPi      = kPi / 2.0;
        constexpr f64 kDegToRad    = kPi / 180.0;
        constexpr f64 kRadToDeg    = 180.0 / kPi;
        constexpr f64 kHourToRad   = kPi / 12.0;
        constexpr f64 kRadToHour   = 12.0 / kPi;
        constexpr f64 kArcSecToRad = 4.848136811095359935899141e-6;
        constexpr f64 kArcSecPerRad = 3600.0 * 180.0 / kPi;
        constexpr f64 kArcSecPerCircle = 1296000.0;
        constexpr f64 kJ2000       = 2451545.0;  // Julian Date of J2000.0 epoch

        constexpr f64 kMjdBasis          = 2400000.5;              // JD of MJD zero
        constexpr f64 kJ2000InMjd        = kJ2000 - kMjdBasis;     // 51544.5
        constexpr f64 kSecondsPerDay     = 86400.0;
        constexpr f64 kDaysPerCentury    = 36525.0;
        constexpr f64 kDaysPerMillennium = 365250.0;
        constexpr f64 kSolarDaysPerSiderealDay = 0.9972695717592592;

        constexpr f64 kKmPerAu         = 1.4959787069098932e+8;
        constexpr f64 kSpeedOfLightAuPerDay = 173.1446326846693;
        constexpr f64 kEarthRadiusKm   = 6378.1366;
        constexpr f64 kEarthFlattening = 0.003352819697896;
        constexpr f64 kAuPerParsec     = 648000.0 / kPi;

        constexpr f64 kMeanSynodicMonth   = 29.530588;   // days
        constexpr f64 kEarthOrbitalPeriod = 365.256;     // days
        constexpr f64 kRefractionNearHorizon = 34.0 / 60.0;  // degrees

        constexpr f64 kSunRadiusAu  = 4.6505e-3;
        constexpr f64 kMoonRadiusAu = 1.15717e-5;
    }
}
