//------------------------------------------------------------------------------
//     AUTHORING
//------------------------------------------------------------------------------
/**
 * @file dbi.cpp
 * @author Rayan MALEK
 * @date 2026-10-19
 * @brief Implementation of the double-bracket flow and its step search.
 */

//------------------------------------------------------------------------------
//     INCLUDES
//------------------------------------------------------------------------------

#include "dbi.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <complex>
#include <nlopt.hpp>
#include <spdlog/spdlog.h>

//------------------------------------------------------------------------------
//     OBJECTIVE NAMES
//------------------------------------------------------------------------------

DbiObjective dbi_objective_from_name(const std::string &name) {
  if (name == "energy")
    return DbiObjective::Energy;
  if (name == "off_diagonal_norm")
    return DbiObjective::OffDiagonalNorm;
  if (name == "energy_fluctuation")
    return DbiObjective::EnergyFluctuation;
  throw ConfigurationError("Unknown DBI step objective: " + name);
}

std::string to_string(DbiObjective objective) {
  switch (objective) {
  case DbiObjective::Energy:
    return "energy";
  case DbiObjective::OffDiagonalNorm:
    return "off_diagonal_norm";
  case DbiObjective::EnergyFluctuation:
    return "energy_fluctuation";
  }
  return "energy";
}

//------------------------------------------------------------------------------
//     FLOW GENERATOR
//------------------------------------------------------------------------------

Eigen::MatrixXcd FlowGenerator::commutator(const Eigen::MatrixXcd &h) {
  Eigen::MatrixXcd d = h.diagonal().asDiagonal();
  return d * h - h * d;
}

FlowGenerator::FlowGenerator(const Eigen::MatrixXcd &h) {
  Eigen::MatrixXcd g = commutator(h);
  if (!g.allFinite()) {
    throw NumericalInstabilityError(
        "DBI generator [diag(H), H] is not finite");
  }
  generator_norm = g.norm();

  const std::complex<double> I(0.0, 1.0);
  Eigen::MatrixXcd k = I * g;
  k = 0.5 * (k + k.adjoint()).eval();

  Eigen::SelfAdjointEigenSolver<Eigen::MatrixXcd> solver(k);
  if (solver.info() != Eigen::Success) {
    throw NumericalInstabilityError(
        "Eigen-decomposition of the DBI generator did not converge");
  }
  vectors = solver.eigenvectors();
  values = solver.eigenvalues();
}

Eigen::MatrixXcd FlowGenerator::apply(const Eigen::MatrixXcd &h,
                                      double step) const {
  const std::complex<double> I(0.0, 1.0);

  Eigen::VectorXcd phases(values.size());
  for (Eigen::Index j = 0; j < values.size(); ++j) {
    phases(j) = std::exp(-I * step * values(j));
  }
  // exp(sG) = V exp(-isL) V^+
  Eigen::MatrixXcd e = vectors * phases.asDiagonal() * vectors.adjoint();
  if (!e.allFinite()) {
    throw NumericalInstabilityError("Matrix exponential of the DBI generator "
                                    "overflowed (step " +
                                    std::to_string(step) + ")");
  }

  Eigen::MatrixXcd flowed = e * h * e.adjoint();
  if (!flowed.allFinite()) {
    throw NumericalInstabilityError("DBI flow produced non-finite entries");
  }
  return 0.5 * (flowed + flowed.adjoint());
}

//------------------------------------------------------------------------------
//     CONSTRUCTOR
//------------------------------------------------------------------------------

DoubleBracketBooster::DoubleBracketBooster(DbiSettings settings)
    : settings(settings) {
  if (!(settings.step > 0.0)) {
    throw ConfigurationError("DBI step size must be positive");
  }
  if (!(settings.step_min > 0.0) || !(settings.step_min < settings.step_max)) {
    throw ConfigurationError("DBI step search needs 0 < step_min < step_max");
  }
  if (settings.max_evals <= 0) {
    throw ConfigurationError("DBI step search needs a positive evaluation cap");
  }
  if (settings.flat_gradient_threshold < 0.0) {
    throw ConfigurationError("Flat gradient threshold must be non-negative");
  }
}

//------------------------------------------------------------------------------
//     STEP SIZE SEARCH
//------------------------------------------------------------------------------

double DoubleBracketBooster::proxy(const Eigen::MatrixXcd &h) const {
  switch (settings.objective) {
  case DbiObjective::Energy:
    return h(0, 0).real();
  case DbiObjective::OffDiagonalNorm: {
    Eigen::MatrixXcd off = h;
    off.diagonal().setZero();
    return off.norm();
  }
  case DbiObjective::EnergyFluctuation: {
    // H|0> is the first column
    double avg_h = h(0, 0).real();
    double avg_h2 = h.col(0).squaredNorm();
    return std::sqrt(std::abs(avg_h2 - avg_h * avg_h));
  }
  }
  return h(0, 0).real();
}

double DoubleBracketBooster::step_objective(const std::vector<double> &x,
                                            std::vector<double> &grad,
                                            void *data_ptr) {
  StepData *data = static_cast<StepData *>(data_ptr);
  try {
    double value = data->booster.proxy(data->generator.apply(data->h, x[0]));
    if (!std::isfinite(value)) {
      throw NumericalInstabilityError("DBI step objective is not finite at s = " +
                                      std::to_string(x[0]));
    }
    data->nevals++;
    if (!grad.empty())
      grad[0] = 0.0;
    return value;
  } catch (const std::exception &) {
    data->error = std::current_exception();
    throw nlopt::forced_stop();
  }
}

double DoubleBracketBooster::select_step(const Eigen::MatrixXcd &h,
                                         const FlowGenerator &generator) const {
  // Flat objective guard: forward difference at s = 0
  double f0 = proxy(h);
  double f1 = proxy(generator.apply(h, settings.step_min));
  double slope = (f1 - f0) / settings.step_min;
  if (!std::isfinite(slope)) {
    throw NumericalInstabilityError("DBI step objective is not finite");
  }
  if (std::abs(slope) < settings.flat_gradient_threshold) {
    spdlog::debug("[DBI] Flat {} objective (slope {:.3e}), using fixed step "
                  "{}",
                  to_string(settings.objective), slope, settings.step);
    return settings.step;
  }

  nlopt::opt search(nlopt::LN_COBYLA, 1);
  search.set_lower_bounds(std::vector<double>{settings.step_min});
  search.set_upper_bounds(std::vector<double>{settings.step_max});
  search.set_maxeval(settings.max_evals);
  search.set_xtol_abs(1e-3 * settings.step_min);
  search.set_initial_step(0.1 * (settings.step_max - settings.step_min));

  StepData data{*this, h, generator};
  search.set_min_objective(step_objective, &data);

  std::vector<double> x{
      std::clamp(settings.step, settings.step_min, settings.step_max)};
  double best = 0.0;
  try {
    search.optimize(x, best);
  } catch (const nlopt::forced_stop &) {
    if (data.error)
      std::rethrow_exception(data.error);
    throw;
  } catch (const nlopt::roundoff_limited &) {
    spdlog::debug("[DBI] Step search limited by round-off, keeping s = {}",
                  x[0]);
  }

  spdlog::debug("[DBI] Step search: s = {:.5f}, {} = {:.10f} ({} evals)", x[0],
                to_string(settings.objective), best, data.nevals);
  return x[0];
}

//------------------------------------------------------------------------------
//     EXECUTION
//------------------------------------------------------------------------------

DbiOutcome DoubleBracketBooster::run(const HamiltonianModel &hamiltonian,
                                     int nsteps, bool optimize_step) const {
  if (nsteps < 0) {
    throw ConfigurationError("DBI step count must be non-negative, got " +
                             std::to_string(nsteps));
  }

  spdlog::info("[DBI] Applying {} steps of DBI to the given hamiltonian "
               "({} step size)",
               nsteps, optimize_step ? "optimized" : "fixed");

  DbiOutcome outcome{hamiltonian, {}, {}, {}};
  const Eigen::VectorXcd zero_state = hamiltonian.zero_state();

  for (int k = 0; k < nsteps; ++k) {
    const Eigen::MatrixXcd &h = outcome.hamiltonian.matrix();
    FlowGenerator generator(h);

    double step = optimize_step ? select_step(h, generator) : settings.step;

    outcome.hamiltonian =
        HamiltonianModel(hamiltonian.nqubits(), generator.apply(h, step));

    double energy = outcome.hamiltonian.expectation(zero_state);
    double fluctuation = outcome.hamiltonian.energy_fluctuation(zero_state);
    outcome.energies.push_back(energy);
    outcome.fluctuations.push_back(fluctuation);
    outcome.step_sizes.push_back(step);

    spdlog::info("[DBI] step {}/{}: s = {:.5f}, energy = {:.10f}, "
                 "fluctuation = {:.6e}, ||G|| = {:.3e}",
                 k + 1, nsteps, step, energy, fluctuation, generator.norm());
  }

  return outcome;
}
