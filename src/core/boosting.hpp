//------------------------------------------------------------------------------
//     AUTHORING
//------------------------------------------------------------------------------
/**
 * @file boosting.hpp
 * @author Rayan MALEK
 * @date 2026-10-19
 * @brief Boosting loop interleaving VQE training, Hamiltonian rotation and
 * double-bracket diagonalization.
 */

#pragma once

//------------------------------------------------------------------------------
//     INCLUDES
//------------------------------------------------------------------------------

#include "ansatz.hpp"
#include "backend.hpp"
#include "dbi.hpp"
#include "hamiltonian.hpp"
#include "rotator.hpp"
#include "vqe_trainer.hpp"
#include <map>
#include <optional>
#include <random>
#include <string>
#include <vector>

//------------------------------------------------------------------------------
//     STRUCTS
//------------------------------------------------------------------------------

/**
 * @struct BoostRound
 * @brief Everything produced by one TRAIN -> ROTATE -> DIAGONALIZE cycle.
 */
struct BoostRound {
  int index;
  OptimizationTrace vqe_trace;
  OptimizerResult optimizer;
  std::vector<double> trained_parameters;
  std::vector<double> dbi_energies;
  std::vector<double> dbi_fluctuations;
  std::vector<double> dbi_step_sizes;
  HamiltonianModel hamiltonian_in;  ///< Hamiltonian entering the round.
  HamiltonianModel hamiltonian_out; ///< DBI output, input of the next round.
};

/**
 * @struct RunResult
 * @brief Per-round histories plus terminal scalars of a boosting run.
 */
struct RunResult {
  std::map<int, BoostRound> rounds;
  double energy = 0.0;      ///< <0|H_final|0>
  double fluctuation = 0.0; ///< Fluctuation of H_final on |0>
  bool success = false;     ///< Last round's optimizer flag.
  std::string message;      ///< Last round's optimizer message.
  double best_loss = 0.0;   ///< Last round's best VQE energy.
  double true_ground_energy = 0.0; ///< Lowest eigenvalue of the input.
};

/**
 * @struct BoostSettings
 * @brief Loop-level options of BoostingOrchestrator::run().
 */
struct BoostSettings {
  int nboost = 1;
  std::optional<int> train_iterations; ///< Per-round evaluation cap.
  int dbi_steps = 1;
  bool optimize_dbi_step = false;
  std::string optimizer = "Powell";
  double tolerance = 1e-2;
};

/**
 * @brief Stage of the boosting state machine.
 */
enum class BoostStage { Train, Rotate, Diagonalize, Done };

std::string to_string(BoostStage stage);

//------------------------------------------------------------------------------
//     CLASS DECLARATION
//------------------------------------------------------------------------------

/**
 * @class BoostingOrchestrator
 * @brief Runs nboost rounds of VQE training followed by DBI boosting.
 *
 * Rounds are strictly sequential: the DBI output of round b is the
 * Hamiltonian trained against in round b + 1. Round 0 starts from the given
 * (or seeded random) parameters, later rounds restart from zero since the
 * rotation changed the frame.
 */
class BoostingOrchestrator {
public:
  /**
   * @param backend Backend sized for the ansatz.
   * @param ansatz Circuit structure shared by every round.
   * @param dbi_settings Step size policy of the DBI stage.
   * @param seed Seed of the parameter generator and of NLopt.
   */
  BoostingOrchestrator(QuestBackend &backend, const Ansatz &ansatz,
                       DbiSettings dbi_settings = DbiSettings(),
                       unsigned long seed = 42);

  /**
   * @brief Runs the full boosting loop.
   *
   * @param initial_hamiltonian Hamiltonian entering round 0.
   * @param settings Loop options.
   * @param initial_parameters Round-0 parameters; drawn from N(0, 1) with the
   * orchestrator seed when empty.
   * @throws ConfigurationError before any numerical work on invalid input.
   */
  RunResult run(const HamiltonianModel &initial_hamiltonian,
                const BoostSettings &settings,
                std::vector<double> initial_parameters = {});

  /**
   * @brief Standard normal parameters from the orchestrator generator.
   */
  std::vector<double> random_parameters();

  BoostStage get_stage() const { return stage; }

private:
  const Ansatz &ansatz;
  VQETrainer trainer;
  HamiltonianRotator rotator;
  DoubleBracketBooster booster;
  unsigned long seed;
  std::mt19937 rng;
  BoostStage stage = BoostStage::Done;

  void enter(BoostStage next, int round);
};
