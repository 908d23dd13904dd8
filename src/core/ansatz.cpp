//------------------------------------------------------------------------------
//     AUTHORING
//------------------------------------------------------------------------------
/**
 * @file ansatz.cpp
 * @author Rayan MALEK
 * @date 2026-02-19
 * @brief Implementation of the HEA ansatz.
 */

//------------------------------------------------------------------------------
//     INCLUDES
//------------------------------------------------------------------------------

#include "ansatz.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>

//------------------------------------------------------------------------------
//     HEA IMPLEMENTATION
//------------------------------------------------------------------------------

HEA::HEA(int num_qubits, int depth) : num_qubits(num_qubits), depth(depth) {
  if (num_qubits <= 0 || depth <= 0) {
    throw ConfigurationError("HEA needs positive qubit and layer counts, got " +
                             std::to_string(num_qubits) + " qubits, " +
                             std::to_string(depth) + " layers");
  }
}

/**
 * @brief Gets the name of the HEA ansatz.
 * @return std::string Name.
 */
std::string HEA::get_name() const {
  return "HEA Ansatz, depth " + std::to_string(depth) + ", qubits " +
         std::to_string(num_qubits) + ", Type : RX-RY-RZ + linear CNOT";
}

/**
 * @brief Gets the number of parameters for HEA.
 *
 * 3 parameters per qubit per layer (Rx, Ry, Rz).
 *
 * @return int Number of parameters.
 */
int HEA::get_num_params() const { return 3 * num_qubits * depth; }

/**
 * @brief Constructs the HEA circuit.
 *
 * Applies rotation layers followed by entangling CNOT layers.
 *
 * @param qubits Quantum register.
 * @param params Rotation angles, layer-major then qubit-major.
 */
void HEA::construct_circuit(Qureg qubits,
                            const std::vector<double> &params) const {
  if ((int)params.size() != get_num_params()) {
    spdlog::error("[HEA] Received {} params, expected {}", params.size(),
                  get_num_params());
    throw ConfigurationError("HEA expects " + std::to_string(get_num_params()) +
                             " parameters, got " +
                             std::to_string(params.size()));
  }

  for (int i = 0; i < depth; ++i) {
    for (int j = 0; j < num_qubits; ++j) {
      int param_index = 3 * (i * num_qubits + j);
      applyRotateX(qubits, j, params[param_index]);
      applyRotateY(qubits, j, params[param_index + 1]);
      applyRotateZ(qubits, j, params[param_index + 2]);
    }
    // Linear CNOT entanglement
    for (int j = 0; j < num_qubits - 1; ++j) {
      applyControlledPauliX(qubits, j, j + 1);
    }
  }
}

int HEA::get_num_qubits() const { return num_qubits; }

int HEA::get_depth() const { return depth; }
