/// @file ephemeris.cpp
/// @brief Body dispatch for heliocentric positions.

#include "ephemeris/ephemeris.hpp"

#include "core/error.hpp"
#include "core/logger.hpp"
#include "ephemeris/chebyshev.hpp"
#include "ephemeris/lunar_theory.hpp"
#include "ephemeris/vsop.hpp"

namespace almanac::ephemeris
{

astro::AstroVector Ephemeris::helio_vector(Body body, const astro::Instant& time)
{
    switch (body)
    {
        case Body::Mercury:
        case Body::Venus:
        case Body::Earth:
        case Body::Mars:
        case Body::Jupiter:
        case Body::Saturn:
        case Body::Uranus:
        case Body::Neptune:
            return astro::AstroVector{.pos = Vsop::position(body, time.tt()), .time = time};

        case Body::Pluto:
            return astro::AstroVector{.pos = Chebyshev::pluto(time.tt()), .time = time};

        case Body::Sun:
            return astro::AstroVector{.pos = Vec3d(0.0), .time = time};

        case Body::Moon:
            return astro::AstroVector{
                .pos  = earth(time).pos + LunarTheory::geo_moon(time).pos,
                .time = time,
            };

        default:
            break;
    }

    ALM_CORE_ERROR("Ephemeris: no heliocentric model for body {}", static_cast<i32>(body));
    throw core::InvalidBodyError();
}

astro::AstroVector Ephemeris::earth(const astro::Instant& time)
{
    return astro::AstroVector{.pos = Vsop::position(Body::Earth, time.tt()), .time = time};
}

} // namespace almanac::ephemeris
