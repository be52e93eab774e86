#pragma once

/// @file error.hpp
/// @brief Exception hierarchy for astronomy computations.
///
/// Argument mistakes by the caller (bad epoch pair, hour angle out of range)
/// are reported with std::invalid_argument / std::out_of_range. Everything
/// derived from AstroError describes a condition of the computation itself.

#include <stdexcept>
#include <string>

namespace almanac::core
{
    /// @brief Base class of all almanac computation errors.
    class AstroError : public std::runtime_error
    {
    public:
        explicit AstroError(const std::string& message)
            : std::runtime_error(message)
        {
        }
    };

    /// @brief The body is not supported by the requested operation.
    class InvalidBodyError : public AstroError
    {
    public:
        explicit InvalidBodyError(const std::string& message = "Invalid body for this operation")
            : AstroError(message)
        {
        }
    };

    /// @brief The operation is geocentric and cannot take Earth as its target.
    class EarthNotAllowedError : public InvalidBodyError
    {
    public:
        EarthNotAllowedError()
            : InvalidBodyError("The Earth is not allowed as the body for this operation")
        {
        }
    };

    /// @brief A direction vector has zero (or vanishing) length.
    class BadVectorError : public AstroError
    {
    public:
        BadVectorError()
            : AstroError("Vector is too small to define a direction")
        {
        }
    };

    /// @brief An iterative solver exceeded its iteration cap.
    class NoConvergeError : public AstroError
    {
    public:
        explicit NoConvergeError(const std::string& message)
            : AstroError(message)
        {
        }
    };

    /// @brief A condition that cannot happen unless the algorithm itself is wrong.
    class InternalError : public AstroError
    {
    public:
        explicit InternalError(const std::string& message)
            : AstroError(message)
        {
        }
    };

} // namespace almanac::core
