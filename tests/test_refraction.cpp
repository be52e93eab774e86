/// @file test_refraction.cpp
/// @brief Unit tests for almanac::astro::Refractions.
///
/// Reference values follow the Saemundsson formula as used by the
/// JPL Horizons "apparent" refraction model.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "astro/refraction.hpp"
#include "core/types.hpp"

#include <array>
#include <cmath>

using namespace almanac;
using namespace almanac::astro;

static constexpr f64 kRoundTripTol = 1e-9;   // degrees

// =================================================================
// Forward refraction
// =================================================================

TEST_CASE("Airless refraction is always zero")
{
    for (const f64 alt : {-45.0, -1.0, 0.0, 10.0, 89.0})
    {
        CHECK(Refractions::refraction_angle(Refraction::Airless, alt) == 0.0);
    }
}

TEST_CASE("Normal refraction at the horizon is about 29 arcminutes")
{
    const f64 refr = Refractions::refraction_angle(Refraction::Normal, 0.0);
    CHECK(refr == doctest::Approx(0.4830321230741662).epsilon(1e-12));
}

TEST_CASE("Refraction at 10 degrees altitude")
{
    const f64 refr = Refractions::refraction_angle(Refraction::JplHorizons, 10.0);
    CHECK(refr == doctest::Approx(0.09012801338558875).epsilon(1e-12));
}

TEST_CASE("Normal refraction tapers to zero toward the nadir")
{
    const f64 near_nadir = Refractions::refraction_angle(Refraction::Normal, -89.9);
    CHECK(near_nadir == doctest::Approx(0.0007264950796415597).epsilon(1e-9));

    const f64 at_minus_one = Refractions::refraction_angle(Refraction::Normal, -1.0);
    const f64 halfway = Refractions::refraction_angle(Refraction::Normal, -45.5);
    CHECK(halfway == doctest::Approx(at_minus_one / 2.0).epsilon(1e-12));
}

TEST_CASE("JPL Horizons refraction holds the -1 degree value below it")
{
    const f64 at_minus_one = Refractions::refraction_angle(Refraction::JplHorizons, -1.0);
    CHECK(Refractions::refraction_angle(Refraction::JplHorizons, -30.0) == doctest::Approx(at_minus_one));
}

TEST_CASE("Refraction outside [-90, +90] is zero")
{
    CHECK(Refractions::refraction_angle(Refraction::Normal, 90.5) == 0.0);
    CHECK(Refractions::refraction_angle(Refraction::Normal, -91.0) == 0.0);
    CHECK(Refractions::inverse_refraction_angle(Refraction::Normal, 95.0) == 0.0);
}

// =================================================================
// Inverse refraction
// =================================================================

TEST_CASE("Inverse refraction undoes forward refraction")
{
    constexpr std::array<f64, 6> kAltitudes = {-1.0, 0.0, 0.5, 5.0, 30.0, 60.0};

    for (const Refraction mode : {Refraction::Normal, Refraction::JplHorizons})
    {
        for (const f64 bent : kAltitudes)
        {
            const f64 inv = Refractions::inverse_refraction_angle(mode, bent);
            CHECK(inv <= 0.0);

            const f64 true_alt = bent + inv;
            const f64 recovered = true_alt + Refractions::refraction_angle(mode, true_alt);
            CHECK(std::abs(recovered - bent) < kRoundTripTol);
        }
    }
}

TEST_CASE("Inverse refraction is zero without an atmosphere")
{
    CHECK(Refractions::inverse_refraction_angle(Refraction::Airless, 12.0) == 0.0);
}
