#pragma once

/// @file light_time.hpp
/// @brief Apparent geocentric and topocentric positions corrected for light travel time.

#include "astro/coordinates.hpp"
#include "astro/observer.hpp"
#include "astro/time_system.hpp"
#include "ephemeris/body.hpp"

namespace almanac::astro
{
    /// @brief Reference frame of the returned equatorial coordinates.
    enum class EquatorEpoch
    {
        J2000,    ///< Mean equator and equinox of J2000
        OfDate,   ///< True equator and equinox of the observation time
    };

    /// @brief Static utility class for light-time corrected positions.
    class LightTime
    {
    public:
        LightTime() = delete;

        /// @brief Position of @p body relative to the Earth's center, J2000 equatorial (AU).
        ///
        /// The body is placed where it was when the light now arriving left it.
        /// With @p aberration the Earth is also back-dated to that moment, which
        /// approximates stellar aberration to first order.
        /// @throws core::NoConvergeError if 10 light-time iterations do not settle.
        [[nodiscard]] static AstroVector geo_vector(ephemeris::Body body, const Instant& time, bool aberration);

        /// @brief Topocentric equatorial coordinates of @p body for an observer.
        [[nodiscard]] static EquatorialCoord equator(
            ephemeris::Body body,
            const Instant& time,
            const GeoLocation& observer,
            EquatorEpoch epoch,
            bool aberration
        );
    };

} // namespace almanac::astro
