//------------------------------------------------------------------------------
//     AUTHORING
//------------------------------------------------------------------------------
/**
 * @file vqe_trainer.cpp
 * @author Rayan MALEK
 * @date 2026-10-19
 * @brief Implementation of the VQE trainer.
 */

//------------------------------------------------------------------------------
//     INCLUDES
//------------------------------------------------------------------------------

#include "vqe_trainer.hpp"
#include "errors.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

//------------------------------------------------------------------------------
//     TRACE
//------------------------------------------------------------------------------

std::vector<double> OptimizationTrace::energies() const {
  std::vector<double> out;
  out.reserve(samples_.size());
  for (const auto &s : samples_)
    out.push_back(s.energy);
  return out;
}

std::vector<double> OptimizationTrace::fluctuations() const {
  std::vector<double> out;
  out.reserve(samples_.size());
  for (const auto &s : samples_)
    out.push_back(s.fluctuation);
  return out;
}

std::vector<std::vector<double>> OptimizationTrace::parameters() const {
  std::vector<std::vector<double>> out;
  out.reserve(samples_.size());
  for (const auto &s : samples_)
    out.push_back(s.parameters);
  return out;
}

//------------------------------------------------------------------------------
//     OPTIMIZER NAMES
//------------------------------------------------------------------------------

nlopt::algorithm VQETrainer::algorithm_from_name(const std::string &name) {
  if (name == "Powell" || name == "praxis")
    return nlopt::LN_PRAXIS;
  if (name == "Nelder-Mead")
    return nlopt::LN_NELDERMEAD;
  if (name == "COBYLA")
    return nlopt::LN_COBYLA;
  if (name == "BOBYQA")
    return nlopt::LN_BOBYQA;
  if (name == "sbplx")
    return nlopt::LN_SBPLX;
  throw ConfigurationError("Unknown optimizer: " + name);
}

std::string VQETrainer::describe(nlopt::result result) {
  switch (result) {
  case nlopt::SUCCESS:
    return "Optimization terminated successfully.";
  case nlopt::STOPVAL_REACHED:
    return "Stop value reached.";
  case nlopt::FTOL_REACHED:
    return "Function tolerance reached.";
  case nlopt::XTOL_REACHED:
    return "Parameter tolerance reached.";
  case nlopt::MAXEVAL_REACHED:
    return "Maximum number of function evaluations has been exceeded.";
  case nlopt::MAXTIME_REACHED:
    return "Maximum time has been exceeded.";
  case nlopt::ROUNDOFF_LIMITED:
    return "Optimization stopped by round-off errors.";
  case nlopt::FORCED_STOP:
    return "Optimization was forcibly stopped.";
  default:
    return "Optimization failed (NLopt code " + std::to_string((int)result) +
           ").";
  }
}

bool VQETrainer::is_success(nlopt::result result) {
  return result == nlopt::SUCCESS || result == nlopt::STOPVAL_REACHED ||
         result == nlopt::FTOL_REACHED || result == nlopt::XTOL_REACHED;
}

//------------------------------------------------------------------------------
//     CONSTRUCTOR
//------------------------------------------------------------------------------

VQETrainer::VQETrainer(QuestBackend &backend, const Ansatz &ansatz)
    : backend(backend), ansatz(ansatz) {}

//------------------------------------------------------------------------------
//     COST FUNCTION
//------------------------------------------------------------------------------

/**
 * @brief Energy of the circuit state at @p params.
 *
 * Records parameters, energy and fluctuation in the trace. Exceptions cannot
 * cross the NLopt C callback, so they are parked in CostData and the
 * optimization is force-stopped.
 */
double VQETrainer::cost_function(const std::vector<double> &params,
                                 std::vector<double> &grad, void *data_ptr) {
  CostData *data = static_cast<CostData *>(data_ptr);

  try {
    Eigen::VectorXcd state = data->backend.execute(data->ansatz, params);
    double energy = data->hamiltonian.expectation(state);
    double fluctuation = data->hamiltonian.energy_fluctuation(state);

    data->trace.record(params, energy, fluctuation);
    spdlog::trace("[VQE] eval {} energy {:.10f} fluctuation {:.3e}",
                  data->trace.size(), energy, fluctuation);

    // Gradient-free algorithms only
    if (!grad.empty())
      std::fill(grad.begin(), grad.end(), 0.0);

    return energy;
  } catch (const std::exception &) {
    data->error = std::current_exception();
    throw nlopt::forced_stop();
  }
}

//------------------------------------------------------------------------------
//     EXECUTION
//------------------------------------------------------------------------------

TrainingOutcome VQETrainer::train(const HamiltonianModel &hamiltonian,
                                  const std::vector<double> &initial_parameters,
                                  const TrainerSettings &settings) {
  if ((int)initial_parameters.size() != ansatz.get_num_params()) {
    throw ConfigurationError("Initial parameters have length " +
                             std::to_string(initial_parameters.size()) +
                             ", the ansatz needs " +
                             std::to_string(ansatz.get_num_params()));
  }
  if (hamiltonian.nqubits() != ansatz.get_num_qubits()) {
    throw DimensionMismatchError(
        "Hamiltonian has " + std::to_string(hamiltonian.nqubits()) +
        " qubits, ansatz has " + std::to_string(ansatz.get_num_qubits()));
  }
  if (settings.tolerance < 0.0) {
    throw ConfigurationError("Tolerance must be non-negative");
  }
  if (settings.max_iterations && *settings.max_iterations <= 0) {
    throw ConfigurationError("max_iterations must be positive");
  }

  nlopt::algorithm algo = algorithm_from_name(settings.optimizer);
  nlopt::srand(settings.seed);

  nlopt::opt optimizer(algo, initial_parameters.size());
  optimizer.set_ftol_rel(settings.tolerance);
  if (settings.max_iterations)
    optimizer.set_maxeval(*settings.max_iterations);

  TrainingOutcome outcome;
  outcome.parameters = initial_parameters;

  CostData data{backend, ansatz, hamiltonian, outcome.trace};
  optimizer.set_min_objective(cost_function, &data);

  spdlog::info("[VQE] Starting {} with {} params and max {} evaluations",
               optimizer.get_algorithm_name(), initial_parameters.size(),
               settings.max_iterations ? std::to_string(*settings.max_iterations)
                                       : std::string("unbounded"));

  double min_energy = 0.0;
  nlopt::result code = nlopt::FAILURE;
  try {
    code = optimizer.optimize(outcome.parameters, min_energy);
  } catch (const nlopt::forced_stop &) {
    if (data.error)
      std::rethrow_exception(data.error);
    throw;
  } catch (const nlopt::roundoff_limited &) {
    // The best point found so far is still in outcome.parameters
    code = nlopt::ROUNDOFF_LIMITED;
    min_energy = optimizer.last_optimum_value();
    spdlog::warn("[VQE] Optimization limited by round-off errors");
  }

  outcome.result.fun = min_energy;
  outcome.result.success = is_success(code);
  outcome.result.message = describe(code);
  outcome.result.nevals = (int)outcome.trace.size();

  spdlog::info("[VQE] Optimization finished - Result code: {}, Min Energy: "
               "{:.6f}, evaluations: {}",
               (int)code, min_energy, outcome.result.nevals);
  if (!outcome.result.success) {
    spdlog::warn("[VQE] Not converged: {}", outcome.result.message);
  }

  return outcome;
}
