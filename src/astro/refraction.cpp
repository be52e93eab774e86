/// @file refraction.cpp
/// @brief Implementation of refraction and its inverse.

#include "astro/refraction.hpp"

#include "core/error.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cmath>

namespace almanac::astro
{

f64 Refractions::refraction_angle(Refraction refraction, f64 altitude)
{
    if (altitude < -90.0 || altitude > 90.0)
    {
        return 0.0;
    }

    if (refraction == Refraction::Airless)
    {
        return 0.0;
    }

    // The formula diverges near h = -5.11, so stay at -1 degree or above
    const f64 hd = std::max(altitude, -1.0);
    f64 refr = (1.02 / std::tan((hd + 10.3 / (hd + 5.11)) * astro_constants::kDegToRad)) / 60.0;

    if (refraction == Refraction::Normal && altitude < -1.0)
    {
        // Linear taper: full value at -1 degree, zero at the nadir
        refr *= (altitude + 90.0) / 89.0;
    }

    return refr;
}

f64 Refractions::inverse_refraction_angle(Refraction refraction, f64 bent_altitude)
{
    if (bent_altitude < -90.0 || bent_altitude > 90.0)
    {
        return 0.0;
    }

    constexpr i32 kMaxIterations = 100;

    f64 altitude = bent_altitude - refraction_angle(refraction, bent_altitude);
    for (i32 iter = 0; iter < kMaxIterations; ++iter)
    {
        const f64 diff = (altitude + refraction_angle(refraction, altitude)) - bent_altitude;
        if (std::abs(diff) < 1.0e-14)
        {
            return altitude - bent_altitude;
        }
        altitude -= diff;
    }

    ALM_CORE_ERROR("Refractions: inverse refraction did not converge for altitude {}", bent_altitude);
    throw core::NoConvergeError("Inverse refraction did not converge");
}

} // namespace almanac::astro
