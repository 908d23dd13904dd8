//------------------------------------------------------------------------------
//     AUTHORING
//------------------------------------------------------------------------------
/**
 * @file backend.hpp
 * @author Rayan MALEK
 * @date 2026-10-19
 * @brief QuEST state-vector backend used to evaluate ansatz circuits.
 */

#pragma once

//------------------------------------------------------------------------------
//     INCLUDES
//------------------------------------------------------------------------------

#include "ansatz.hpp"
#include <Eigen/Dense>
#include <quest.h>
#include <string>
#include <vector>

//------------------------------------------------------------------------------
//     CLASS DECLARATION
//------------------------------------------------------------------------------

/**
 * @class QuestBackend
 * @brief Owns one QuEST register and runs circuits on it.
 *
 * The QuEST environment is initialized on first use and shared by every
 * backend in the process. The register is released on destruction.
 */
class QuestBackend {
public:
  /**
   * @brief Allocates a register of @p num_qubits qubits.
   */
  explicit QuestBackend(int num_qubits);

  ~QuestBackend();

  QuestBackend(const QuestBackend &) = delete;
  QuestBackend &operator=(const QuestBackend &) = delete;

  /**
   * @brief Runs the ansatz on |0...0> and returns the final state vector.
   *
   * @throws DimensionMismatchError if the ansatz acts on another register size.
   */
  Eigen::VectorXcd execute(const Ansatz &ansatz,
                           const std::vector<double> &params);

  /**
   * @brief Matrix of the circuit unitary, one basis state per column.
   */
  Eigen::MatrixXcd unitary(const Ansatz &ansatz,
                           const std::vector<double> &params);

  int get_num_qubits() const { return num_qubits; }

  /**
   * @brief Identifiers accepted in the "backend" configuration field.
   */
  static bool is_supported(const std::string &name);

  /**
   * @brief Sets the worker thread count of QuEST (OpenMP) and Eigen.
   */
  static void set_num_threads(int nthreads);

  /**
   * @brief Initializes the QuEST environment if nobody did yet.
   */
  static void ensure_environment();

private:
  int num_qubits;
  Qureg qubits;

  void check_register(const Ansatz &ansatz) const;
  Eigen::VectorXcd read_amplitudes() const;
};
