//------------------------------------------------------------------------------
//     AUTHORING
//------------------------------------------------------------------------------
/**
 * @file ansatz.hpp
 * @author Rayan MALEK
 * @date 2026-02-19
 * @brief Definition of the Ansatz abstract base class and the Hardware
 * Efficient Ansatz.
 */

#pragma once

//------------------------------------------------------------------------------
//     INCLUDES
//------------------------------------------------------------------------------

#include <quest.h>
#include <string>
#include <vector>

//------------------------------------------------------------------------------
//     BASE CLASS
//------------------------------------------------------------------------------

/**
 * @class Ansatz
 * @brief Abstract base class for variational ansatz circuits.
 *
 * An ansatz only describes the circuit structure. Parameters are supplied on
 * every application and never stored, so the same object can be evaluated at
 * any point of the parameter space.
 */
class Ansatz {

public:
  /**
   * @brief Virtual destructor to ensure proper cleanup of derived classes.
   */
  virtual ~Ansatz() = default;

  /**
   * @brief Applies the parameterized circuit to a quantum register.
   *
   * @param qubits The quantum register to apply operations to.
   * @param params The variational parameters.
   * @throws ConfigurationError if the parameter count is wrong.
   */
  virtual void construct_circuit(Qureg qubits,
                                 const std::vector<double> &params) const = 0;

  /**
   * @brief Gets the number of variational parameters required.
   * @return int Number of parameters.
   */
  virtual int get_num_params() const = 0;

  /**
   * @brief Gets the number of qubits the circuit acts on.
   */
  virtual int get_num_qubits() const = 0;

  /**
   * @brief Gets the name and description of the ansatz.
   * @return std::string Name/Description.
   */
  virtual std::string get_name() const = 0;
};

//------------------------------------------------------------------------------
//     HARDWARE EFFICIENT ANSATZ (HEA)
//------------------------------------------------------------------------------

/**
 * @class HEA
 * @brief Hardware Efficient Ansatz implementation.
 *
 * Uses a layered structure of single-qubit rotations (Rx, Ry, Rz) followed by
 * entangling gates (CNOT chain). Designed to be suitable for NISQ devices.
 */
class HEA : public Ansatz {

private:
  int num_qubits; ///< Number of qubits.
  int depth;      ///< Number of layers.

public:
  /**
   * @brief Constructs a new HEA object.
   *
   * @param num_qubits Number of qubits.
   * @param depth Depth of the ansatz (number of layers).
   * @throws ConfigurationError if either value is not positive.
   */
  HEA(int num_qubits, int depth);

  void construct_circuit(Qureg qubits,
                         const std::vector<double> &params) const override;

  int get_num_qubits() const override;

  int get_depth() const;

  int get_num_params() const override;

  std::string get_name() const override;
};
