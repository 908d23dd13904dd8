//------------------------------------------------------------------------------
//     AUTHORING
//------------------------------------------------------------------------------
/**
 * @file rotator.hpp
 * @author Rayan MALEK
 * @date 2026-10-19
 * @brief Rotation of a Hamiltonian into the frame of a trained circuit.
 */

#pragma once

#include "ansatz.hpp"
#include "backend.hpp"
#include "hamiltonian.hpp"
#include <Eigen/Dense>
#include <vector>

/**
 * @class HamiltonianRotator
 * @brief Computes U^dagger H U, U being the circuit unitary at given
 * parameters.
 *
 * In the rotated frame the reference state |0...0> carries the trained VQE
 * energy: <0|U^dagger H U|0> = <psi|H|psi>.
 */
class HamiltonianRotator {
public:
  explicit HamiltonianRotator(QuestBackend &backend) : backend(backend) {}

  /**
   * @throws DimensionMismatchError if the circuit, backend and Hamiltonian
   * qubit counts disagree.
   * @throws ConfigurationError if the parameter count is wrong.
   */
  Eigen::MatrixXcd rotate(const HamiltonianModel &hamiltonian,
                          const Ansatz &circuit,
                          const std::vector<double> &parameters) const;

private:
  QuestBackend &backend;
};
