/// @file rotation.cpp
/// @brief Implementation of frame rotation builders.

#include "astro/rotation.hpp"

#include "astro/earth_orientation.hpp"
#include "core/logger.hpp"

#include <glm/matrix.hpp>

#include <cmath>
#include <stdexcept>

namespace almanac::astro
{

RotationMatrix RotationMatrix::inverse() const
{
    return RotationMatrix(glm::transpose(m_matrix));
}

RotationMatrix RotationMatrix::combine(const RotationMatrix& first, const RotationMatrix& second)
{
    return RotationMatrix(second.m_matrix * first.m_matrix);
}

// -----------------------------------------------------------------
// Precession (IAU 2006, Capitaine et al. 2003), angles in arcseconds:
//
//   psi_A   = 5038.481507 t - 1.0790069 t^2 - 0.00114045 t^3
//           + 0.000132851 t^4 - 0.0000000951 t^5
//   omega_A = eps0 - 0.025754 t + 0.0512623 t^2 - 0.00772503 t^3
//           - 0.000000467 t^4 + 0.0000003337 t^5
//   chi_A   = 10.556403 t - 2.3814292 t^2 - 0.00121197 t^3
//           + 0.000170663 t^4 - 0.0000000560 t^5
//
// R = R3(chi_A) R1(-omega_A) R3(-psi_A) R1(eps0)
// -----------------------------------------------------------------

RotationMatrix Rotations::precession(f64 tt1, f64 tt2)
{
    if (tt1 != 0.0 && tt2 != 0.0)
    {
        ALM_CORE_ERROR("Rotations: precession requires one epoch at J2000 (got {} and {})", tt1, tt2);
        throw std::invalid_argument("One of (tt1, tt2) must be zero");
    }

    f64 t = (tt2 - tt1) / astro_constants::kDaysPerCentury;
    if (tt2 == 0.0)
    {
        t = -t;
    }

    constexpr f64 kEps0 = 84381.406;

    const f64 psia = (((((-0.0000000951 * t
                          + 0.000132851) * t
                          - 0.00114045) * t
                          - 1.0790069) * t
                          + 5038.481507) * t);

    const f64 omegaa = (((((+0.0000003337 * t
                            - 0.000000467) * t
                            - 0.00772503) * t
                            + 0.0512623) * t
                            - 0.025754) * t + kEps0);

    const f64 chia = (((((-0.0000000560 * t
                          + 0.000170663) * t
                          - 0.00121197) * t
                          - 2.3814292) * t
                          + 10.556403) * t);

    const f64 eps0 = kEps0 * astro_constants::kArcSecToRad;
    const f64 sa = std::sin(eps0);
    const f64 ca = std::cos(eps0);
    const f64 sb = std::sin(-psia * astro_constants::kArcSecToRad);
    const f64 cb = std::cos(-psia * astro_constants::kArcSecToRad);
    const f64 sc = std::sin(-omegaa * astro_constants::kArcSecToRad);
    const f64 cc = std::cos(-omegaa * astro_constants::kArcSecToRad);
    const f64 sd = std::sin(chia * astro_constants::kArcSecToRad);
    const f64 cd = std::cos(chia * astro_constants::kArcSecToRad);

    const f64 xx =  cd * cb - sb * sd * cc;
    const f64 yx =  cd * sb * ca + sd * cc * cb * ca - sa * sd * sc;
    const f64 zx =  cd * sb * sa + sd * cc * cb * sa + ca * sd * sc;
    const f64 xy = -sd * cb - sb * cd * cc;
    const f64 yy = -sd * sb * ca + cd * cc * cb * ca - sa * cd * sc;
    const f64 zy = -sd * sb * sa + cd * cc * cb * sa + ca * cd * sc;
    const f64 xz =  sb * sc;
    const f64 yz = -sc * cb * ca - sa * cc;
    const f64 zz = -sc * cb * sa + cc * ca;

    // glm takes columns: the first three scalars are column 0
    if (tt2 == 0.0)
    {
        // Epoch of date to J2000
        return RotationMatrix(Mat3d(xx, yx, zx,
                                    xy, yy, zy,
                                    xz, yz, zz));
    }

    // J2000 to epoch of date
    return RotationMatrix(Mat3d(xx, xy, xz,
                                yx, yy, yz,
                                zx, zy, zz));
}

// -----------------------------------------------------------------
// Nutation: R1(-eps_true) R3(-dpsi) R1(eps_mean)
// -----------------------------------------------------------------

RotationMatrix Rotations::nutation(const Instant& time, NutationDirection direction)
{
    const EarthTilt& tilt = time.tilt();
    const f64 oblm = tilt.mean_obliquity * astro_constants::kDegToRad;
    const f64 oblt = tilt.true_obliquity * astro_constants::kDegToRad;
    const f64 psi = tilt.dpsi * astro_constants::kArcSecToRad;

    const f64 cobm = std::cos(oblm);
    const f64 sobm = std::sin(oblm);
    const f64 cobt = std::cos(oblt);
    const f64 sobt = std::sin(oblt);
    const f64 cpsi = std::cos(psi);
    const f64 spsi = std::sin(psi);

    const f64 xx = cpsi;
    const f64 yx = -spsi * cobm;
    const f64 zx = -spsi * sobm;
    const f64 xy = spsi * cobt;
    const f64 yy = cpsi * cobm * cobt + sobm * sobt;
    const f64 zy = cpsi * sobm * cobt - cobm * sobt;
    const f64 xz = spsi * sobt;
    const f64 yz = cpsi * cobm * sobt - sobm * cobt;
    const f64 zz = cpsi * sobm * sobt + cobm * cobt;

    if (direction == NutationDirection::MeanToTrue)
    {
        return RotationMatrix(Mat3d(xx, xy, xz,
                                    yx, yy, yz,
                                    zx, zy, zz));
    }

    return RotationMatrix(Mat3d(xx, yx, zx,
                                xy, yy, zy,
                                xz, yz, zz));
}

RotationMatrix Rotations::ecliptic_to_equatorial(f64 obliquity_rad)
{
    const f64 c = std::cos(obliquity_rad);
    const f64 s = std::sin(obliquity_rad);
    return RotationMatrix(Mat3d(1.0, 0.0, 0.0,
                                0.0,   c,   s,
                                0.0,  -s,   c));
}

RotationMatrix Rotations::equatorial_to_ecliptic(f64 obliquity_rad)
{
    const f64 c = std::cos(obliquity_rad);
    const f64 s = std::sin(obliquity_rad);
    return RotationMatrix(Mat3d(1.0, 0.0, 0.0,
                                0.0,   c,  -s,
                                0.0,   s,   c));
}

RotationMatrix Rotations::eqj_to_ecl()
{
    // cos and sin of the J2000 mean obliquity, 0.40909260059599012 rad
    constexpr f64 c = 0.9174821430670688;
    constexpr f64 s = 0.3977769691083922;
    return RotationMatrix(Mat3d(1.0, 0.0, 0.0,
                                0.0,   c,  -s,
                                0.0,   s,   c));
}

RotationMatrix Rotations::spin(f64 angle_deg)
{
    const f64 c = std::cos(angle_deg * astro_constants::kDegToRad);
    const f64 s = std::sin(angle_deg * astro_constants::kDegToRad);
    return RotationMatrix(Mat3d(  c,  -s, 0.0,
                                  s,   c, 0.0,
                                0.0, 0.0, 1.0));
}

} // namespace almanac::astro
