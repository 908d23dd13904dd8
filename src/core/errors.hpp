//------------------------------------------------------------------------------
//     AUTHORING
//------------------------------------------------------------------------------
/**
 * @file errors.hpp
 * @author Rayan MALEK
 * @date 2026-10-19
 * @brief Exception types raised by the boosting pipeline.
 */

#pragma once

//------------------------------------------------------------------------------
//     INCLUDES
//------------------------------------------------------------------------------

#include <stdexcept>
#include <string>

//------------------------------------------------------------------------------
//     EXCEPTIONS
//------------------------------------------------------------------------------

/**
 * @class BoostError
 * @brief Base class of every fatal error raised by the boosting pipeline.
 */
class BoostError : public std::runtime_error {
public:
  explicit BoostError(const std::string &what) : std::runtime_error(what) {}
};

/**
 * @class ConfigurationError
 * @brief Invalid options, dimensions, step counts or Hamiltonian names.
 *
 * Raised before any numerical work starts.
 */
class ConfigurationError : public BoostError {
public:
  explicit ConfigurationError(const std::string &what) : BoostError(what) {}
};

/**
 * @class DimensionMismatchError
 * @brief Circuit and Hamiltonian disagree on the number of qubits.
 */
class DimensionMismatchError : public BoostError {
public:
  explicit DimensionMismatchError(const std::string &what)
      : BoostError(what) {}
};

/**
 * @class NumericalInstabilityError
 * @brief Overflow or NaN during the double-bracket flow.
 */
class NumericalInstabilityError : public BoostError {
public:
  explicit NumericalInstabilityError(const std::string &what)
      : BoostError(what) {}
};
