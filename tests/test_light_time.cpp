/// @file test_light_time.cpp
/// @brief Unit tests for almanac::astro::LightTime and SolarGeometry.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "astro/illumination.hpp"
#include "astro/light_time.hpp"
#include "astro/solar_geometry.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "ephemeris/body.hpp"

#include <cmath>

using namespace almanac;
using namespace almanac::astro;
using ephemeris::Body;

static constexpr f64 kPosTol = 1e-10;   // AU
static constexpr f64 kAngTol = 1e-9;    // relative

static bool near(const Vec3d& a, const Vec3d& b, f64 tol)
{
    return glm::length(a - b) < tol;
}

// =================================================================
// Geocentric vectors
// =================================================================

TEST_CASE("Mars with and without aberration")
{
    const Instant t(1000.0);

    const AstroVector with_ab = LightTime::geo_vector(Body::Mars, t, true);
    CHECK(near(with_ab.pos, Vec3d(-2.5531846504592073, 0.4628971519155405, 0.255979454002464), kPosTol));
    CHECK(with_ab.time.ut() == doctest::Approx(1000.0));

    const AstroVector without_ab = LightTime::geo_vector(Body::Mars, t, false);
    CHECK(near(without_ab.pos, Vec3d(-2.553161689220161, 0.4626609904108475, 0.25587706720139414), kPosTol));
}

TEST_CASE("Geocentric Sun")
{
    const AstroVector sun = LightTime::geo_vector(Body::Sun, Instant(1000.0), true);
    CHECK(near(sun.pos, Vec3d(-0.9996081290937504, -0.06701124969834618, -0.02905191515815732), kPosTol));
}

TEST_CASE("The Earth is at the geocentre")
{
    const AstroVector earth = LightTime::geo_vector(Body::Earth, Instant(1000.0), true);
    CHECK(glm::length(earth.pos) == 0.0);
}

TEST_CASE("Invalid body propagates InvalidBodyError")
{
    CHECK_THROWS_AS((void)LightTime::geo_vector(Body::Invalid, Instant(0.0), true), core::InvalidBodyError);
}

// =================================================================
// Topocentric equatorial coordinates
// =================================================================

TEST_CASE("Topocentric Mars in J2000 and of-date equator")
{
    const Instant t(1000.0);
    const GeoLocation observer = {.latitude_deg = 30.0, .longitude_deg = -100.0, .height_m = 500.0};

    const EquatorialCoord j2000 = LightTime::equator(Body::Mars, t, observer, EquatorEpoch::J2000, true);
    CHECK(j2000.ra == doctest::Approx(11.314973536062725).epsilon(kAngTol));
    CHECK(j2000.dec == doctest::Approx(5.6335820133164285).epsilon(kAngTol));
    CHECK(j2000.dist == doctest::Approx(2.6073969932813155).epsilon(kAngTol));

    const EquatorialCoord ofdate = LightTime::equator(Body::Mars, t, observer, EquatorEpoch::OfDate, true);
    CHECK(ofdate.ra == doctest::Approx(11.317047046329385).epsilon(kAngTol));
    CHECK(ofdate.dec == doctest::Approx(5.620585777012569).epsilon(kAngTol));
    CHECK(ofdate.dist == doctest::Approx(j2000.dist).epsilon(1e-12));
}

// =================================================================
// Sun-relative geometry
// =================================================================

TEST_CASE("Sun position on 2000-01-01")
{
    const EclipticCoord sun = SolarGeometry::sun_position(Instant(-0.5));
    CHECK(sun.elon == doctest::Approx(279.85896810773664).epsilon(kAngTol));
    CHECK(std::abs(sun.elat) < 1e-5);
}

TEST_CASE("Venus relative to the Sun on 2000-01-01")
{
    const Instant t(-0.5);
    CHECK(SolarGeometry::angle_from_sun(Body::Venus, t) == doctest::Approx(38.95136006241013).epsilon(kAngTol));
    CHECK(SolarGeometry::longitude_from_sun(Body::Venus, t) == doctest::Approx(321.0953886885086).epsilon(kAngTol));

    const ElongationEvent e = SolarGeometry::elongation(Body::Venus, t);
    CHECK(e.visibility == Visibility::Morning);
    CHECK(e.ecliptic_separation == doctest::Approx(360.0 - 321.0953886885086).epsilon(kAngTol));
}

TEST_CASE("Heliocentric longitude of Mars")
{
    CHECK(SolarGeometry::ecliptic_longitude(Body::Mars, Instant(-0.5)) == doctest::Approx(359.1354613392988).epsilon(kAngTol));
    CHECK_THROWS_AS((void)SolarGeometry::ecliptic_longitude(Body::Sun, Instant(0.0)), core::InvalidBodyError);
}

TEST_CASE("Angle from the Sun is undefined for the Earth")
{
    CHECK_THROWS_AS((void)SolarGeometry::angle_from_sun(Body::Earth, Instant(0.0)), core::EarthNotAllowedError);
}

TEST_CASE("Moon phase on 2000-01-01 is a waning crescent")
{
    CHECK(SolarGeometry::moon_phase(Instant(-0.5)) == doctest::Approx(297.42855835268506).epsilon(kAngTol));
}

// =================================================================
// Illumination
// =================================================================

TEST_CASE("Visual magnitudes")
{
    const Instant t(1000.0);

    struct Expected
    {
        Body body;
        f64 mag;
        f64 phase_angle;
    };

    const Expected cases[] = {
        {Body::Mercury, 5.725725202830292, 172.1746488856895},
        {Body::Venus, -4.785644497740281, 120.5698228934173},
        {Body::Mars, 1.8206800206984515, 9.463471527092684},
        {Body::Jupiter, -1.9245474433367908, 8.700180460545537},
        {Body::Uranus, 5.738854835577302, 1.7968473676127419},
        {Body::Neptune, 7.871960535786379, 1.5801665577812734},
        {Body::Pluto, 13.944473672357582, 1.779575893378217},
        {Body::Moon, -10.888792104816634, 64.49297988106528},
    };

    for (const Expected& c : cases)
    {
        CAPTURE(ephemeris::body_name(c.body));
        const IlluminationInfo info = Illumination::compute(c.body, t);
        CHECK(info.magnitude == doctest::Approx(c.mag).epsilon(1e-8));
        CHECK(info.phase_angle == doctest::Approx(c.phase_angle).epsilon(1e-8));
        CHECK_FALSE(info.ring_tilt.has_value());
    }
}

TEST_CASE("Saturn magnitude includes the rings")
{
    const IlluminationInfo info = Illumination::compute(Body::Saturn, Instant(1000.0));
    CHECK(info.magnitude == doctest::Approx(-0.11273185697962873).epsilon(1e-8));
    REQUIRE(info.ring_tilt.has_value());
    CHECK(*info.ring_tilt == doctest::Approx(26.35562642764442).epsilon(1e-8));
}

TEST_CASE("The Sun is fully lit")
{
    const IlluminationInfo info = Illumination::compute(Body::Sun, Instant(1000.0));
    CHECK(info.magnitude == doctest::Approx(-26.73719576237972).epsilon(1e-8));
    CHECK(info.phase_angle == 0.0);
    CHECK(info.phase_fraction == doctest::Approx(1.0));
}

TEST_CASE("Illumination of the Earth is rejected")
{
    CHECK_THROWS_AS((void)Illumination::compute(Body::Earth, Instant(0.0)), core::EarthNotAllowedError);
}
