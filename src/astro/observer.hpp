#pragma once

/// @file observer.hpp
/// @brief Geographic location of an observer on the Earth's surface.

#include "core/types.hpp"

namespace almanac::astro
{
    /// @brief Geodetic observer location (WGS-style ellipsoid, IERS radius).
    struct GeoLocation
    {
        f64 latitude_deg = 0.0;    ///< Geodetic latitude (degrees, north positive)
        f64 longitude_deg = 0.0;   ///< Longitude (degrees, east positive)
        f64 height_m = 0.0;        ///< Height above sea level (metres)
    };

} // namespace almanac::astro
