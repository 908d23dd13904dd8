//------------------------------------------------------------------------------
//     AUTHORING
//------------------------------------------------------------------------------
/**
 * @file boosting.cpp
 * @author Rayan MALEK
 * @date 2026-10-19
 * @brief Implementation of the boosting loop.
 */

//------------------------------------------------------------------------------
//     INCLUDES
//------------------------------------------------------------------------------

#include "boosting.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>

std::string to_string(BoostStage stage) {
  switch (stage) {
  case BoostStage::Train:
    return "TRAIN";
  case BoostStage::Rotate:
    return "ROTATE";
  case BoostStage::Diagonalize:
    return "DIAGONALIZE";
  case BoostStage::Done:
    return "DONE";
  }
  return "DONE";
}

//------------------------------------------------------------------------------
//     CONSTRUCTOR
//------------------------------------------------------------------------------

BoostingOrchestrator::BoostingOrchestrator(QuestBackend &backend,
                                           const Ansatz &ansatz,
                                           DbiSettings dbi_settings,
                                           unsigned long seed)
    : ansatz(ansatz), trainer(backend, ansatz), rotator(backend),
      booster(dbi_settings), seed(seed), rng(seed) {
  if (backend.get_num_qubits() != ansatz.get_num_qubits()) {
    throw DimensionMismatchError(
        "Backend register has " + std::to_string(backend.get_num_qubits()) +
        " qubits, ansatz has " + std::to_string(ansatz.get_num_qubits()));
  }
}

std::vector<double> BoostingOrchestrator::random_parameters() {
  std::normal_distribution<double> normal(0.0, 1.0);
  std::vector<double> params(ansatz.get_num_params());
  for (auto &p : params)
    p = normal(rng);
  return params;
}

void BoostingOrchestrator::enter(BoostStage next, int round) {
  spdlog::debug("[Boost] round {}: {} -> {}", round, to_string(stage),
                to_string(next));
  stage = next;
}

//------------------------------------------------------------------------------
//     EXECUTION
//------------------------------------------------------------------------------

RunResult BoostingOrchestrator::run(const HamiltonianModel &initial_hamiltonian,
                                    const BoostSettings &settings,
                                    std::vector<double> initial_parameters) {
  // Validate everything before the first circuit evaluation
  if (settings.nboost < 1) {
    throw ConfigurationError("nboost must be >= 1, got " +
                             std::to_string(settings.nboost));
  }
  if (settings.dbi_steps < 0) {
    throw ConfigurationError("dbi_steps must be >= 0, got " +
                             std::to_string(settings.dbi_steps));
  }
  if (settings.train_iterations && *settings.train_iterations <= 0) {
    throw ConfigurationError("Per-round training iterations must be positive");
  }
  if (settings.tolerance < 0.0) {
    throw ConfigurationError("Tolerance must be non-negative");
  }
  // Throws on unknown optimizer names
  VQETrainer::algorithm_from_name(settings.optimizer);
  if (initial_hamiltonian.nqubits() != ansatz.get_num_qubits()) {
    throw DimensionMismatchError(
        "Hamiltonian has " + std::to_string(initial_hamiltonian.nqubits()) +
        " qubits, ansatz has " + std::to_string(ansatz.get_num_qubits()));
  }
  if (initial_parameters.empty()) {
    initial_parameters = random_parameters();
  } else if ((int)initial_parameters.size() != ansatz.get_num_params()) {
    throw ConfigurationError("Initial parameters have length " +
                             std::to_string(initial_parameters.size()) +
                             ", the ansatz needs " +
                             std::to_string(ansatz.get_num_params()));
  }

  TrainerSettings train_settings;
  train_settings.optimizer = settings.optimizer;
  train_settings.tolerance = settings.tolerance;
  train_settings.max_iterations = settings.train_iterations;
  train_settings.seed = seed;

  RunResult result;
  result.true_ground_energy = initial_hamiltonian.ground_energy();
  spdlog::info("[Boost] Target ground energy: {:.10f}",
               result.true_ground_energy);

  HamiltonianModel current = initial_hamiltonian;
  std::vector<double> round_parameters = std::move(initial_parameters);

  for (int b = 0; b < settings.nboost; ++b) {
    spdlog::info("[Boost] Running {}/{} max optimization rounds.", b + 1,
                 settings.nboost);

    enter(BoostStage::Train, b);
    TrainingOutcome trained =
        trainer.train(current, round_parameters, train_settings);

    enter(BoostStage::Rotate, b);
    HamiltonianModel rotated(
        current.nqubits(),
        rotator.rotate(current, ansatz, trained.parameters));

    enter(BoostStage::Diagonalize, b);
    DbiOutcome dbi =
        booster.run(rotated, settings.dbi_steps, settings.optimize_dbi_step);

    result.rounds.emplace(
        b, BoostRound{b, std::move(trained.trace), trained.result,
                      trained.parameters, std::move(dbi.energies),
                      std::move(dbi.fluctuations), std::move(dbi.step_sizes),
                      current, dbi.hamiltonian});

    result.best_loss = trained.result.fun;
    result.success = trained.result.success;
    result.message = trained.result.message;

    current = std::move(dbi.hamiltonian);
    // The rotated frame makes the previous optimum meaningless
    round_parameters.assign(round_parameters.size(), 0.0);
  }

  enter(BoostStage::Done, settings.nboost - 1);

  Eigen::VectorXcd zero_state = current.zero_state();
  result.energy = current.expectation(zero_state);
  result.fluctuation = current.energy_fluctuation(zero_state);

  spdlog::info("[Boost] Energy: {:.10f}", result.energy);
  spdlog::info("[Boost] Energy fluctuation: {:.6e}", result.fluctuation);
  return result;
}
