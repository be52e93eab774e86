#pragma once

/// @file rotation.hpp
/// @brief Orthonormal 3x3 rotations between astronomical reference frames.

#include "astro/time_system.hpp"
#include "core/types.hpp"

namespace almanac::astro
{
    /// @brief Direction of the nutation rotation.
    enum class NutationDirection
    {
        MeanToTrue,   ///< Mean equator of date to true equator of date
        TrueToMean,   ///< True equator of date to mean equator of date
    };

    /// @brief A rotation matrix wrapping glm::dmat3 (column-major, applied as m * v).
    class RotationMatrix
    {
    public:
        RotationMatrix() = default;
        explicit RotationMatrix(const Mat3d& m) : m_matrix(m) {}

        /// @brief Rotate a vector.
        [[nodiscard]] Vec3d apply(const Vec3d& v) const { return m_matrix * v; }

        /// @brief The reverse rotation (the transpose).
        [[nodiscard]] RotationMatrix inverse() const;

        /// @brief A single rotation equivalent to applying @p first, then @p second.
        [[nodiscard]] static RotationMatrix combine(const RotationMatrix& first,
                                                    const RotationMatrix& second);

        [[nodiscard]] const Mat3d& matrix() const { return m_matrix; }

    private:
        Mat3d m_matrix{1.0};
    };

    /// @brief Builders for the rotations used by the coordinate pipeline.
    class Rotations
    {
    public:
        Rotations() = delete;

        /// @brief Precession between J2000 and another epoch (IAU 2006, Capitaine et al.).
        ///
        /// Exactly one of @p tt1, @p tt2 must be zero (J2000). The matrix carries
        /// vectors from epoch @p tt1 to epoch @p tt2.
        /// @throws std::invalid_argument if neither epoch is J2000.
        [[nodiscard]] static RotationMatrix precession(f64 tt1, f64 tt2);

        /// @brief Nutation rotation for the tilt of @p time.
        [[nodiscard]] static RotationMatrix nutation(const Instant& time, NutationDirection direction);

        /// @brief Ecliptic to equatorial for the given obliquity (radians).
        [[nodiscard]] static RotationMatrix ecliptic_to_equatorial(f64 obliquity_rad);

        /// @brief Equatorial to ecliptic for the given obliquity (radians).
        [[nodiscard]] static RotationMatrix equatorial_to_ecliptic(f64 obliquity_rad);

        /// @brief J2000 mean equator to J2000 mean ecliptic.
        [[nodiscard]] static RotationMatrix eqj_to_ecl();

        /// @brief Rotation about the z axis by @p angle_deg (frame rotation, not vector rotation).
        [[nodiscard]] static RotationMatrix spin(f64 angle_deg);
    };

} // namespace almanac::astro
