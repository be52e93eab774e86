/// @file body.cpp
/// @brief Body names and orbital periods.

#include "ephemeris/body.hpp"

#include "core/error.hpp"
#include "core/logger.hpp"

#include <array>
#include <cmath>
#include <cstddef>

namespace almanac::ephemeris
{

namespace
{
    constexpr std::array<const char*, 11> kBodyNames{
        "Mercury", "Venus", "Earth", "Mars", "Jupiter", "Saturn",
        "Uranus", "Neptune", "Pluto", "Sun", "Moon",
    };

    // Sidereal periods in days, Mercury..Pluto
    constexpr std::array<f64, 9> kOrbitalPeriods{
        87.969, 224.701, 365.256, 686.980, 4332.589, 10759.22, 30685.4, 60189.0, 90560.0,
    };
}

const char* body_name(Body body)
{
    const auto index = static_cast<i32>(body);
    if (index < 0 || index >= static_cast<i32>(kBodyNames.size()))
    {
        return "Invalid";
    }
    return kBodyNames[static_cast<std::size_t>(index)];
}

Body body_from_name(std::string_view name)
{
    for (std::size_t i = 0; i < kBodyNames.size(); ++i)
    {
        if (name == kBodyNames[i])
        {
            return static_cast<Body>(i);
        }
    }
    return Body::Invalid;
}

f64 Bodies::orbital_period(Body body)
{
    const auto index = static_cast<i32>(body);
    if (index < 0 || index >= static_cast<i32>(kOrbitalPeriods.size()))
    {
        ALM_CORE_ERROR("Bodies: no orbital period for {}", body_name(body));
        throw core::InvalidBodyError();
    }
    return kOrbitalPeriods[static_cast<std::size_t>(index)];
}

// -----------------------------------------------------------------
// Synodic period
//
// 1/S = |1/P_earth - 1/P_body|, written as |P_e / (P_e/P - 1)|
// -----------------------------------------------------------------

f64 Bodies::synodic_period(Body body)
{
    if (body == Body::Earth)
    {
        ALM_CORE_ERROR("Bodies: synodic period requested for the Earth");
        throw core::EarthNotAllowedError();
    }

    if (body == Body::Moon)
    {
        return astro_constants::kMeanSynodicMonth;
    }

    const f64 period = orbital_period(body);
    return std::abs(astro_constants::kEarthOrbitalPeriod
                    / (astro_constants::kEarthOrbitalPeriod / period - 1.0));
}

bool Bodies::is_superior_planet(Body body)
{
    switch (body)
    {
        case Body::Mars:
        case Body::Jupiter:
        case Body::Saturn:
        case Body::Uranus:
        case Body::Neptune:
        case Body::Pluto:
            return true;
        default:
            return false;
    }
}

} // namespace almanac::ephemeris
