/// @file test_earth_orientation.cpp
/// @brief Unit tests for nutation, obliquity, sidereal time and frame rotations.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "astro/earth_orientation.hpp"
#include "astro/frames.hpp"
#include "astro/nutation_series.hpp"
#include "astro/rotation.hpp"
#include "astro/time_system.hpp"
#include "core/types.hpp"

#include <cmath>
#include <stdexcept>

using namespace almanac;
using namespace almanac::astro;

// =================================================================
// Helpers
// =================================================================

static constexpr f64 kVecTol = 1e-12;

static bool near(const Vec3d& a, const Vec3d& b, f64 tol)
{
    return glm::length(a - b) < tol;
}

// =================================================================
// Nutation and obliquity
// =================================================================

TEST_CASE("Nutation series has 77 luni-solar terms")
{
    CHECK(nutation_terms().size() == 77);
}

TEST_CASE("Earth tilt at J2000.0")
{
    const Instant t(0.0);
    const EarthTilt& tilt = t.tilt();

    CHECK(tilt.dpsi == doctest::Approx(-13.93165864713116).epsilon(1e-10));
    CHECK(tilt.deps == doctest::Approx(-5.769432255216155).epsilon(1e-10));
    CHECK(tilt.mean_obliquity == doctest::Approx(23.4392794441813).epsilon(1e-12));
    CHECK(tilt.true_obliquity == doctest::Approx(23.437676824110405).epsilon(1e-12));
    CHECK(tilt.equation_of_equinoxes == doctest::Approx(-0.8521365354699171).epsilon(1e-10));
}

TEST_CASE("Mean obliquity at J2000.0 is 84381.406 arcseconds")
{
    CHECK(EarthOrientation::mean_obliquity(0.0) == doctest::Approx(84381.406 / 3600.0).epsilon(1e-14));
}

TEST_CASE("True obliquity differs from mean by deps")
{
    const EarthTilt tilt = EarthOrientation::tilt(5000.0);
    CHECK(tilt.true_obliquity - tilt.mean_obliquity == doctest::Approx(tilt.deps / 3600.0).epsilon(1e-12));
}

// =================================================================
// Earth rotation and sidereal time
// =================================================================

TEST_CASE("Earth rotation angle at J2000.0")
{
    CHECK(EarthOrientation::earth_rotation_angle(0.0) == doctest::Approx(280.46061837504).epsilon(1e-12));
}

TEST_CASE("Apparent sidereal time reference values")
{
    CHECK(EarthOrientation::sidereal_time(Instant(0.0)) == doctest::Approx(18.697138124099965).epsilon(1e-11));
    CHECK(EarthOrientation::sidereal_time(Instant(8000.3)) == doctest::Approx(23.595413107577297).epsilon(1e-11));
}

TEST_CASE("Sidereal time stays in [0, 24)")
{
    for (f64 ut = -40000.0; ut < 40000.0; ut += 1234.567)
    {
        const f64 gast = EarthOrientation::sidereal_time(Instant(ut));
        CHECK(gast >= 0.0);
        CHECK(gast < 24.0);
    }
}

// =================================================================
// Rotations
// =================================================================

TEST_CASE("Precession from J2000 to a date")
{
    const Instant t(100.0);
    const Vec3d pos = Frames::precess(0.0, Vec3d(1.0, 0.0, 0.0), t.tt());
    CHECK(near(pos, Vec3d(0.9999999977722083, 6.121990002311465e-05, 2.6602772597709825e-05), kVecTol));
}

TEST_CASE("Precession there and back is the identity")
{
    const Vec3d v(0.3, -0.8, 0.52);
    const f64 tt = 14000.0;

    const Vec3d there = Frames::precess(0.0, v, tt);
    const Vec3d back = Frames::precess(tt, there, 0.0);
    CHECK(near(back, v, kVecTol));
}

TEST_CASE("Precession needs one epoch at J2000")
{
    CHECK_THROWS_AS((void)Rotations::precession(100.0, 200.0), std::invalid_argument);
    CHECK_NOTHROW((void)Rotations::precession(0.0, 0.0));
}

TEST_CASE("Nutation mean to true of date")
{
    const Instant t(100.0);
    const Vec3d pos = Frames::nutate(t, NutationDirection::MeanToTrue, Vec3d(1.0, 0.0, 0.0));
    CHECK(near(pos, Vec3d(0.9999999970570591, -7.038941031396e-05, -3.0515777289044176e-05), kVecTol));
}

TEST_CASE("Nutation forward then inverse is the identity")
{
    const Instant t(-3652.5);
    const Vec3d v(-0.1, 0.7, 0.2);

    const Vec3d true_pos = Frames::nutate(t, NutationDirection::MeanToTrue, v);
    const Vec3d mean_pos = Frames::nutate(t, NutationDirection::TrueToMean, true_pos);
    CHECK(near(mean_pos, v, kVecTol));
}

TEST_CASE("Combined rotation matches applying both in order")
{
    const Instant t(2500.0);
    const RotationMatrix prec = Rotations::precession(0.0, t.tt());
    const RotationMatrix nut = Rotations::nutation(t, NutationDirection::MeanToTrue);
    const RotationMatrix both = RotationMatrix::combine(prec, nut);

    const Vec3d v(0.6, 0.0, -0.8);
    CHECK(near(both.apply(v), nut.apply(prec.apply(v)), kVecTol));
    CHECK(near(both.inverse().apply(both.apply(v)), v, kVecTol));
}

TEST_CASE("J2000 equator to ecliptic rotation")
{
    const Vec3d y = Rotations::eqj_to_ecl().apply(Vec3d(0.0, 1.0, 0.0));
    CHECK(near(y, Vec3d(0.0, 0.9174821430670688, -0.3977769691083922), kVecTol));
}

TEST_CASE("Spin by 90 degrees")
{
    const Vec3d v = Rotations::spin(90.0).apply(Vec3d(1.0, 0.0, 0.0));
    CHECK(near(v, Vec3d(0.0, -1.0, 0.0), kVecTol));
}

// =================================================================
// Observer position
// =================================================================

TEST_CASE("Observer on the equator at sea level is one Earth radius out")
{
    const Vec3d v = Frames::observer_vector(GeoLocation{}, 0.0);
    CHECK(near(v, Vec3d(4.263520978299708e-05, 0.0, 0.0), 1e-18));
}

TEST_CASE("Observer at the pole is one polar radius up")
{
    const Vec3d v = Frames::observer_vector(GeoLocation{.latitude_deg = 90.0}, 5.0);
    CHECK(v.z == doctest::Approx(4.249226161181272e-05).epsilon(1e-12));
    CHECK(std::abs(v.x) < 1e-18);
}

TEST_CASE("Observer position in J2000 equatorial coordinates")
{
    const GeoLocation observer = {.latitude_deg = 45.0, .longitude_deg = 10.0, .height_m = 0.0};
    const Vec3d v = Frames::observer_position(Instant(100.0), observer);
    CHECK(near(v, Vec3d(2.640626255752242e-05, 1.4649854181082479e-05, 2.999646994900709e-05), 1e-14));
}
