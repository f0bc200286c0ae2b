#pragma once
#include <stdexcept>
#include <string>

/** Valuation matrix is not square/empty, or a vector has the wrong length. */
class InvalidShapeError : public std::invalid_argument
{
public:
    explicit InvalidShapeError(const std::string& what)
        : std::invalid_argument(what) {}
};

/** Buyer or product index outside [0, n). */
class OutOfRangeError : public std::out_of_range
{
public:
    explicit OutOfRangeError(const std::string& what)
        : std::out_of_range(what) {}
};
