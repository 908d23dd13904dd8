//------------------------------------------------------------------------------
//     AUTHORING
//------------------------------------------------------------------------------
/**
 * @file rotator.cpp
 * @author Rayan MALEK
 * @date 2026-10-19
 * @brief Implementation of HamiltonianRotator.
 */

#include "rotator.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>

Eigen::MatrixXcd
HamiltonianRotator::rotate(const HamiltonianModel &hamiltonian,
                           const Ansatz &circuit,
                           const std::vector<double> &parameters) const {
  if (circuit.get_num_qubits() != hamiltonian.nqubits()) {
    throw DimensionMismatchError(
        "Cannot rotate a " + std::to_string(hamiltonian.nqubits()) +
        "-qubit Hamiltonian with a " +
        std::to_string(circuit.get_num_qubits()) + "-qubit circuit");
  }
  if (backend.get_num_qubits() != hamiltonian.nqubits()) {
    throw DimensionMismatchError(
        "Backend register has " + std::to_string(backend.get_num_qubits()) +
        " qubits, Hamiltonian has " + std::to_string(hamiltonian.nqubits()));
  }
  if ((int)parameters.size() != circuit.get_num_params()) {
    throw ConfigurationError("Rotation needs " +
                             std::to_string(circuit.get_num_params()) +
                             " parameters, got " +
                             std::to_string(parameters.size()));
  }

  Eigen::MatrixXcd u = backend.unitary(circuit, parameters);
  Eigen::MatrixXcd rotated = u.adjoint() * hamiltonian.matrix() * u;

  // Remove the round-off anti-Hermitian part
  Eigen::MatrixXcd hermitian = 0.5 * (rotated + rotated.adjoint());

  spdlog::debug("[Rotator] Rotated Hamiltonian, <0|H'|0> = {:.10f}",
                hermitian(0, 0).real());
  return hermitian;
}
