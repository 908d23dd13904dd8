//------------------------------------------------------------------------------
//     AUTHORING
//------------------------------------------------------------------------------
/**
 * @file hamiltonian.hpp
 * @author Rayan MALEK
 * @date 2026-10-19
 * @brief Dense Hermitian Hamiltonian model with named spin-chain families.
 */

#pragma once

//------------------------------------------------------------------------------
//     INCLUDES
//------------------------------------------------------------------------------

#include <Eigen/Dense>
#include <complex>
#include <string>
#include <vector>

//------------------------------------------------------------------------------
//     STRUCTS
//------------------------------------------------------------------------------

/**
 * @struct PauliTerm
 * @brief One weighted Pauli string, e.g. 0.5 * "X0 Y1".
 *
 * The string lists operator/qubit tokens separated by spaces. "I" (or an
 * empty string) is the identity.
 */
struct PauliTerm {
  std::complex<double> coeff;
  std::string pauli;
};

//------------------------------------------------------------------------------
//     CLASS DECLARATION
//------------------------------------------------------------------------------

/**
 * @class HamiltonianModel
 * @brief Hermitian operator on @c nqubits qubits stored as a dense matrix.
 *
 * Qubit q corresponds to bit q of the basis index, matching the QuEST
 * amplitude ordering. Instances are values: rotation and diagonalization
 * always build a new model.
 */
class HamiltonianModel {
public:
  //----------------------------------------------------------------------------
  //     CONSTRUCTORS
  //----------------------------------------------------------------------------

  /**
   * @brief Wraps a matrix after checking its shape and Hermiticity.
   *
   * @param nqubits Number of qubits (matrix must be 2^n x 2^n).
   * @param matrix Operator in the computational basis.
   * @throws ConfigurationError if the shape or Hermiticity check fails.
   */
  HamiltonianModel(int nqubits, Eigen::MatrixXcd matrix);

  /**
   * @brief Builds a named family ("XXZ", "TFIM", "X", "Y", "Z").
   * @throws ConfigurationError for unknown names or too few qubits.
   */
  static HamiltonianModel from_family(const std::string &name, int nqubits);

  /**
   * @brief Builds the operator sum of the given Pauli terms.
   * @throws ConfigurationError on malformed strings or out-of-range qubits.
   */
  static HamiltonianModel from_pauli_terms(int nqubits,
                                           const std::vector<PauliTerm> &terms);

  /**
   * @brief Loads a Hamiltonian from a JSON term file.
   *
   * Expected layout: {"n_qubits": n, "<key>": {"pauli_string": "X0 Z1",
   * "coefficient": "(0.5+0j)"}, ...}. Metadata keys are ignored.
   */
  static HamiltonianModel from_json_file(const std::string &filename);

  /**
   * @brief Names accepted by from_family().
   */
  static const std::vector<std::string> &family_names();

  //----------------------------------------------------------------------------
  //     GETTERS
  //----------------------------------------------------------------------------

  int nqubits() const { return num_qubits; }
  long long dimension() const { return (long long)h.rows(); }
  const Eigen::MatrixXcd &matrix() const { return h; }

  //----------------------------------------------------------------------------
  //     OBSERVABLES
  //----------------------------------------------------------------------------

  /**
   * @brief <psi|H|psi> (state assumed normalized).
   */
  double expectation(const Eigen::VectorXcd &state) const;

  /**
   * @brief sqrt(|<H^2> - <H>^2|) on the normalized state.
   */
  double energy_fluctuation(const Eigen::VectorXcd &state) const;

  /**
   * @brief Ascending eigenvalues of the operator.
   */
  Eigen::VectorXd eigenvalues() const;

  double ground_energy() const;

  /**
   * @brief Frobenius norm of the off-diagonal part.
   */
  double off_diagonal_norm() const;

  /**
   * @brief Computational basis state |0...0> of the model's dimension.
   */
  Eigen::VectorXcd zero_state() const;

private:
  int num_qubits;
  Eigen::MatrixXcd h;

  static std::complex<double> parse_coefficient(const std::string &coeff_str);
};
