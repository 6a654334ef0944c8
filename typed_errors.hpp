/**
 * @file typed_errors.hpp
 * @brief Exception types thrown by the typed collections library
 *
 * Every error raised by the library derives from typed::Error so that callers
 * can catch the whole family at once. Nothing in the library catches its own
 * errors: they always surface to the immediate caller.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace typed
{

/// Common base of all library errors
class Error : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/// A constraint expression such as "int|string" could not be parsed
class ConstraintSyntaxError : public Error
{
public:
    using Error::Error;
};

/**
 * @brief A value was rejected by a collection's TypeSet
 *
 * Raised synchronously at the point of the attempted write. For batched writes
 * every element before the offending one stays committed.
 */
class TypeMismatch : public Error
{
public:
    using Error::Error;
};

/// No default value can be derived for a constraint and none was supplied
class Unrepresentable : public Error
{
public:
    using Error::Error;
};

/// Lookup or removal by a key that is not present
class KeyNotFound : public Error
{
public:
    using Error::Error;
};

/// Positional access beyond the bounds of an ordered collection
class IndexOutOfRange : public Error
{
public:
    using Error::Error;
};

/// Removal or aggregation on an empty collection
class Underflow : public Error
{
public:
    using Error::Error;
};

/// A variadic entry point was called with an argument count it cannot interpret
class ArgumentArityMismatch : public Error
{
public:
    using Error::Error;
};

/// An argument has an acceptable type but an unusable value (zero range step, uneven combine, ...)
class InvalidArgument : public Error
{
public:
    using Error::Error;
};

} // namespace typed
