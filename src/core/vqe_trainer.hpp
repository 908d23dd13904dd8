//------------------------------------------------------------------------------
//     AUTHORING
//------------------------------------------------------------------------------
/**
 * @file vqe_trainer.hpp
 * @author Rayan MALEK
 * @date 2026-10-19
 * @brief VQE training of an ansatz against a dense Hamiltonian with NLopt.
 */

#pragma once

//------------------------------------------------------------------------------
//     INCLUDES
//------------------------------------------------------------------------------

#include "ansatz.hpp"
#include "backend.hpp"
#include "hamiltonian.hpp"
#include <exception>
#include <nlopt.hpp>
#include <optional>
#include <string>
#include <vector>

//------------------------------------------------------------------------------
//     STRUCTS
//------------------------------------------------------------------------------

/**
 * @struct TraceSample
 * @brief One objective evaluation recorded during training.
 */
struct TraceSample {
  std::vector<double> parameters;
  double energy;
  double fluctuation;
};

/**
 * @class OptimizationTrace
 * @brief Append-only record of every objective evaluation of one training.
 */
class OptimizationTrace {
public:
  void record(const std::vector<double> &parameters, double energy,
              double fluctuation) {
    samples_.push_back({parameters, energy, fluctuation});
  }

  const std::vector<TraceSample> &samples() const { return samples_; }
  std::size_t size() const { return samples_.size(); }
  bool empty() const { return samples_.empty(); }

  std::vector<double> energies() const;
  std::vector<double> fluctuations() const;
  std::vector<std::vector<double>> parameters() const;

private:
  std::vector<TraceSample> samples_;
};

/**
 * @struct OptimizerResult
 * @brief Terminal state reported by the classical optimizer.
 */
struct OptimizerResult {
  double fun = 0.0;    ///< Best objective value found.
  bool success = false;
  std::string message; ///< Human readable stop reason.
  int nevals = 0;      ///< Number of objective evaluations.
};

/**
 * @struct TrainingOutcome
 * @brief Everything a VQE training call produces.
 */
struct TrainingOutcome {
  OptimizerResult result;
  std::vector<double> parameters; ///< Best parameters found.
  OptimizationTrace trace;
};

/**
 * @struct TrainerSettings
 * @brief Knobs of a single training call.
 */
struct TrainerSettings {
  std::string optimizer = "Powell";
  double tolerance = 1e-2;
  std::optional<int> max_iterations; ///< Unbounded when empty.
  unsigned long seed = 42;           ///< Seed of NLopt's internal generator.
};

//------------------------------------------------------------------------------
//     CLASS DECLARATION
//------------------------------------------------------------------------------

/**
 * @class VQETrainer
 * @brief Minimizes <psi(theta)|H|psi(theta)> over the ansatz parameters.
 *
 * Every objective evaluation runs the circuit on the backend and records the
 * parameters, energy and energy fluctuation in the returned trace.
 * Non-convergence is not an error: it is reported through
 * OptimizerResult::success.
 */
class VQETrainer {
public:
  VQETrainer(QuestBackend &backend, const Ansatz &ansatz);

  /**
   * @brief Runs one optimization from @p initial_parameters.
   *
   * @throws ConfigurationError on a parameter count mismatch, an unknown
   * optimizer, a negative tolerance or a non-positive iteration cap.
   * @throws DimensionMismatchError if ansatz and Hamiltonian sizes differ.
   */
  TrainingOutcome train(const HamiltonianModel &hamiltonian,
                        const std::vector<double> &initial_parameters,
                        const TrainerSettings &settings);

  /**
   * @brief Maps an optimizer identifier onto a derivative-free NLopt
   * algorithm.
   * @throws ConfigurationError for unknown identifiers.
   */
  static nlopt::algorithm algorithm_from_name(const std::string &name);

  /**
   * @brief Short text for an NLopt result code.
   */
  static std::string describe(nlopt::result result);

  static bool is_success(nlopt::result result);

private:
  QuestBackend &backend;
  const Ansatz &ansatz;

  /**
   * @struct CostData
   * @brief Context handed to the NLopt C-style objective.
   */
  struct CostData {
    QuestBackend &backend;
    const Ansatz &ansatz;
    const HamiltonianModel &hamiltonian;
    OptimizationTrace &trace;
    std::exception_ptr error = nullptr;
  };

  static double cost_function(const std::vector<double> &params,
                              std::vector<double> &grad, void *data);
};
