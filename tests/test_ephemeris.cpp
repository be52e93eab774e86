/// @file test_ephemeris.cpp
/// @brief Unit tests for almanac::ephemeris (bodies, VSOP87, lunar theory, Pluto).

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "astro/coordinates.hpp"
#include "astro/time_system.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "ephemeris/body.hpp"
#include "ephemeris/chebyshev.hpp"
#include "ephemeris/ephemeris.hpp"
#include "ephemeris/lunar_theory.hpp"

#include <cmath>
#include <stdexcept>

using namespace almanac;
using namespace almanac::ephemeris;

static constexpr f64 kPosTol = 1e-10;   // AU

static bool near(const Vec3d& a, const Vec3d& b, f64 tol)
{
    return glm::length(a - b) < tol;
}

// =================================================================
// Bodies
// =================================================================

TEST_CASE("Body names round-trip")
{
    for (i32 i = 0; i <= static_cast<i32>(Body::Moon); ++i)
    {
        const auto body = static_cast<Body>(i);
        CHECK(body_from_name(body_name(body)) == body);
    }
    CHECK(body_from_name("Vulcan") == Body::Invalid);
    CHECK(std::string_view(body_name(Body::Invalid)) == "Invalid");
}

TEST_CASE("Synodic periods")
{
    CHECK(Bodies::synodic_period(Body::Mars) == doctest::Approx(779.9342507242231).epsilon(1e-12));
    CHECK(Bodies::synodic_period(Body::Venus) == doctest::Approx(583.9236487922878).epsilon(1e-12));
    CHECK(Bodies::synodic_period(Body::Jupiter) == doctest::Approx(398.8836147064035).epsilon(1e-12));
    CHECK(Bodies::synodic_period(Body::Moon) == doctest::Approx(astro_constants::kMeanSynodicMonth));
}

TEST_CASE("Synodic period of the Earth or the Sun is rejected")
{
    CHECK_THROWS_AS((void)Bodies::synodic_period(Body::Earth), core::EarthNotAllowedError);
    CHECK_THROWS_AS((void)Bodies::synodic_period(Body::Sun), core::InvalidBodyError);
    CHECK_THROWS_AS((void)Bodies::orbital_period(Body::Invalid), core::InvalidBodyError);
}

TEST_CASE("Superior planets lie outside the Earth's orbit")
{
    CHECK_FALSE(Bodies::is_superior_planet(Body::Mercury));
    CHECK_FALSE(Bodies::is_superior_planet(Body::Venus));
    CHECK(Bodies::is_superior_planet(Body::Mars));
    CHECK(Bodies::is_superior_planet(Body::Pluto));
    CHECK_FALSE(Bodies::is_superior_planet(Body::Moon));
}

// =================================================================
// Heliocentric vectors
// =================================================================

TEST_CASE("Earth at J2000.0")
{
    const astro::AstroVector e = Ephemeris::helio_vector(Body::Earth, astro::Instant(0.0));
    CHECK(near(e.pos, Vec3d(-0.1771432638690777, 0.8874150414171629, 0.38474127142454756), kPosTol));
    CHECK(e.length() == doctest::Approx(0.9833163466580792).epsilon(1e-10));
}

TEST_CASE("Jupiter at J2000.0")
{
    const astro::AstroVector j = Ephemeris::helio_vector(Body::Jupiter, astro::Instant(0.0));
    CHECK(near(j.pos, Vec3d(4.0012208304948755, 2.7366246504319074, 1.0756863256735625), kPosTol));
}

TEST_CASE("Sun is the origin")
{
    const astro::AstroVector s = Ephemeris::helio_vector(Body::Sun, astro::Instant(123.0));
    CHECK(glm::length(s.pos) == 0.0);
}

TEST_CASE("Moon is the Earth plus the geocentric Moon")
{
    const astro::Instant t(0.0);
    const astro::AstroVector m = Ephemeris::helio_vector(Body::Moon, t);
    CHECK(near(m.pos, Vec3d(-0.1790922194576487, 0.8856319123993195, 0.3842324454528179), kPosTol));
}

TEST_CASE("Invalid body has no position")
{
    CHECK_THROWS_AS((void)Ephemeris::helio_vector(Body::Invalid, astro::Instant(0.0)), core::InvalidBodyError);
}

// =================================================================
// Moon
// =================================================================

TEST_CASE("Lunar theory at J2000.0")
{
    const LunarPosition moon = LunarTheory::compute(astro::Instant(0.0).tt());
    CHECK(moon.longitude == doctest::Approx(3.89780521636996).epsilon(1e-12));
    CHECK(moon.latitude == doctest::Approx(0.09024729939933299).epsilon(1e-12));
    CHECK(moon.distance_au == doctest::Approx(0.0026901451354906076).epsilon(1e-12));
}

TEST_CASE("Geocentric Moon vector at J2000.0")
{
    const astro::AstroVector m = LunarTheory::geo_moon(astro::Instant(0.0));
    CHECK(near(m.pos, Vec3d(-0.0019489555885710043, -0.0017831290178433447, -0.0005088259717296842), 1e-13));
    CHECK(m.length() * astro_constants::kKmPerAu == doctest::Approx(402440.0).epsilon(1e-5));
}

// =================================================================
// Pluto
// =================================================================

TEST_CASE("Pluto at J2000.0")
{
    const astro::AstroVector p = Ephemeris::helio_vector(Body::Pluto, astro::Instant(0.0));
    CHECK(near(p.pos, Vec3d(-9.875217820295697, -27.9787914009988, -5.753662866479377), 1e-8));
}

TEST_CASE("Pluto model covers a fixed time range")
{
    CHECK_NOTHROW((void)Chebyshev::pluto(-109573.5));
    CHECK_NOTHROW((void)Chebyshev::pluto(73413.5));
    CHECK_THROWS_AS((void)Chebyshev::pluto(-109574.0), std::out_of_range);
    CHECK_THROWS_AS((void)Chebyshev::pluto(80000.0), std::out_of_range);
}
