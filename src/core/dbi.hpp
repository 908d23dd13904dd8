//------------------------------------------------------------------------------
//     AUTHORING
//------------------------------------------------------------------------------
/**
 * @file dbi.hpp
 * @author Rayan MALEK
 * @date 2026-10-19
 * @brief Double-bracket iteration (DBI) flow toward a diagonal Hamiltonian.
 */

#pragma once

//------------------------------------------------------------------------------
//     INCLUDES
//------------------------------------------------------------------------------

#include "hamiltonian.hpp"
#include <Eigen/Dense>
#include <exception>
#include <string>
#include <vector>

//------------------------------------------------------------------------------
//     SETTINGS
//------------------------------------------------------------------------------

/**
 * @brief Quantity minimized when the DBI step size is optimized.
 */
enum class DbiObjective {
  Energy,            ///< <0|H(s)|0>
  OffDiagonalNorm,   ///< ||H(s) - diag(H(s))||_F
  EnergyFluctuation, ///< fluctuation of H(s) on |0>
};

DbiObjective dbi_objective_from_name(const std::string &name);
std::string to_string(DbiObjective objective);

/**
 * @struct DbiSettings
 * @brief Step size policy of the double-bracket flow.
 */
struct DbiSettings {
  double step = 0.01;      ///< Fixed step, also the search fallback.
  double step_min = 1e-4;  ///< Lower bound of the step search.
  double step_max = 0.5;   ///< Upper bound of the step search.
  int max_evals = 50;      ///< Evaluation cap of the step search.
  double flat_gradient_threshold = 1e-10;
  DbiObjective objective = DbiObjective::Energy;
};

/**
 * @struct DbiOutcome
 * @brief Result of DoubleBracketBooster::run().
 *
 * energies[k] and fluctuations[k] are measured on |0...0> after step k.
 */
struct DbiOutcome {
  HamiltonianModel hamiltonian;
  std::vector<double> energies;
  std::vector<double> fluctuations;
  std::vector<double> step_sizes;
};

//------------------------------------------------------------------------------
//     FLOW GENERATOR
//------------------------------------------------------------------------------

/**
 * @class FlowGenerator
 * @brief Spectral form of G = [diag(H), H], giving exp(sG) for any s.
 *
 * G is anti-Hermitian, so K = iG is Hermitian and exp(sG) = V exp(-isL) V^+
 * with K = V L V^+.
 */
class FlowGenerator {
public:
  /**
   * @throws NumericalInstabilityError if G is not finite or the
   * eigen-decomposition fails.
   */
  explicit FlowGenerator(const Eigen::MatrixXcd &h);

  /**
   * @brief The commutator [diag(H), H].
   */
  static Eigen::MatrixXcd commutator(const Eigen::MatrixXcd &h);

  /**
   * @brief exp(sG) H exp(-sG), made exactly Hermitian.
   * @throws NumericalInstabilityError on non-finite results.
   */
  Eigen::MatrixXcd apply(const Eigen::MatrixXcd &h, double step) const;

  double norm() const { return generator_norm; }

private:
  Eigen::MatrixXcd vectors;
  Eigen::VectorXd values;
  double generator_norm = 0.0;
};

//------------------------------------------------------------------------------
//     CLASS DECLARATION
//------------------------------------------------------------------------------

/**
 * @class DoubleBracketBooster
 * @brief Applies a sequence of single-commutator double-bracket steps.
 */
class DoubleBracketBooster {
public:
  /**
   * @throws ConfigurationError on inconsistent step settings.
   */
  explicit DoubleBracketBooster(DbiSettings settings = DbiSettings());

  /**
   * @brief Runs @p nsteps flow steps starting from @p hamiltonian.
   *
   * @param optimize_step Search the step size of every step instead of using
   * the fixed one.
   * @throws ConfigurationError if nsteps < 0.
   * @throws NumericalInstabilityError on overflow/NaN in the flow.
   */
  DbiOutcome run(const HamiltonianModel &hamiltonian, int nsteps,
                 bool optimize_step) const;

  /**
   * @brief Step size chosen for one step on @p h.
   *
   * Falls back to the fixed step when the proxy objective is flat at s = 0.
   */
  double select_step(const Eigen::MatrixXcd &h,
                     const FlowGenerator &generator) const;

  /**
   * @brief Proxy objective of the step search evaluated on a matrix.
   */
  double proxy(const Eigen::MatrixXcd &h) const;

  const DbiSettings &get_settings() const { return settings; }

private:
  DbiSettings settings;

  /**
   * @struct StepData
   * @brief Context handed to the NLopt step objective.
   */
  struct StepData {
    const DoubleBracketBooster &booster;
    const Eigen::MatrixXcd &h;
    const FlowGenerator &generator;
    int nevals = 0;
    std::exception_ptr error = nullptr;
  };

  static double step_objective(const std::vector<double> &x,
                               std::vector<double> &grad, void *data);
};
