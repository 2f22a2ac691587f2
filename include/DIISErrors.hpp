#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Thrown when a trial/residual pair does not have the shape of the pairs already stored in a DIIS history.
 */
class DimensionMismatch : public std::invalid_argument
{
  public:
    explicit DimensionMismatch(const std::string& message) : std::invalid_argument(message) {}
};

/**
 * @brief Thrown when the bordered Pulay system is singular or too ill-conditioned to solve.
 *
 * This is recoverable: the extrapolator catches it and falls back to the latest trial vector.
 */
class SingularExtrapolation : public std::runtime_error
{
  public:
    explicit SingularExtrapolation(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Thrown when an operation needs at least one history entry and there is none.
 */
class EmptyHistory : public std::logic_error
{
  public:
    explicit EmptyHistory(const std::string& message) : std::logic_error(message) {}
};
