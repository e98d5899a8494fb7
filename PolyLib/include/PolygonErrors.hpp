#ifndef POLYGON_ERRORS_HPP_INCLUDED
#define POLYGON_ERRORS_HPP_INCLUDED

#include <stdexcept>
#include <string>

/**
 * @file PolygonErrors.hpp
 * @brief Exception types thrown by the polygon primitive and its helpers.
 *
 * - ConfigurationError: the caller handed in structurally invalid data
 *   (a ring with fewer than three points, a hole that cannot be bridged).
 *   The call is rejected and previously stored state is left untouched.
 * - InvariantViolation: a required field is missing or invalid when the
 *   primitive is ticked. This is a programming error and is never retried.
 * - UseAfterDestroy: a method was called on a destroyed primitive.
 */

class ConfigurationError : public std::invalid_argument
{
public:
    explicit ConfigurationError(const std::string& what) : std::invalid_argument(what)
    {
    }
};

class InvariantViolation : public std::logic_error
{
public:
    explicit InvariantViolation(const std::string& what) : std::logic_error(what)
    {
    }
};

class UseAfterDestroy : public std::logic_error
{
public:
    explicit UseAfterDestroy(const std::string& what) : std::logic_error(what)
    {
    }
};

#endif // POLYGON_ERRORS_HPP_INCLUDED
