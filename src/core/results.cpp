//------------------------------------------------------------------------------
//     AUTHORING
//------------------------------------------------------------------------------
/**
 * @file results.cpp
 * @author Rayan MALEK
 * @date 2026-10-19
 * @brief Implementation of the result recorder.
 */

#include "results.hpp"
#include <fstream>
#include <iomanip>
#include <spdlog/spdlog.h>
#include <stdexcept>

ResultRecorder::ResultRecorder(nlohmann::json config)
    : config(std::move(config)) {}

std::string ResultRecorder::round_key(int round) {
  return nlohmann::json(round).dump();
}

nlohmann::json ResultRecorder::matrix_to_json(const Eigen::MatrixXcd &matrix) {
  nlohmann::json real = nlohmann::json::array();
  nlohmann::json imag = nlohmann::json::array();
  for (Eigen::Index i = 0; i < matrix.rows(); ++i) {
    std::vector<double> re_row(matrix.cols()), im_row(matrix.cols());
    for (Eigen::Index j = 0; j < matrix.cols(); ++j) {
      re_row[j] = matrix(i, j).real();
      im_row[j] = matrix(i, j).imag();
    }
    real.push_back(re_row);
    imag.push_back(im_row);
  }
  return {{"rows", matrix.rows()},
          {"cols", matrix.cols()},
          {"real", real},
          {"imag", imag}};
}

RunRecord ResultRecorder::finalize(const RunResult &result,
                                   const HamiltonianModel &original) const {
  RunRecord record;

  record.metadata = config.is_object() ? config : nlohmann::json::object();
  record.metadata["best_loss"] = result.best_loss;
  record.metadata["true_ground_energy"] = result.true_ground_energy;
  record.metadata["success"] = result.success;
  record.metadata["message"] = result.message;
  record.metadata["energy"] = result.energy;
  record.metadata["fluctuations"] = result.fluctuation;

  record.loss_history = nlohmann::json::object();
  record.fluctuation_history = nlohmann::json::object();
  record.params_history = nlohmann::json::object();
  record.dbi_energies = nlohmann::json::object();
  record.dbi_fluctuations = nlohmann::json::object();
  record.dbi_step_sizes = nlohmann::json::object();

  for (const auto &[b, round] : result.rounds) {
    const std::string key = round_key(b);
    record.loss_history[key] = round.vqe_trace.energies();
    record.fluctuation_history[key] = round.vqe_trace.fluctuations();
    record.params_history[key] = round.vqe_trace.parameters();
    record.dbi_energies[key] = round.dbi_energies;
    record.dbi_fluctuations[key] = round.dbi_fluctuations;
    record.dbi_step_sizes[key] = round.dbi_step_sizes;
  }

  record.hamiltonian = matrix_to_json(original.matrix());
  return record;
}

void ResultRecorder::write(const RunRecord &record,
                           const std::filesystem::path &folder) {
  std::filesystem::create_directories(folder);

  auto dump = [&folder](const char *name, const nlohmann::json &j) {
    std::filesystem::path path = folder / name;
    std::ofstream o(path);
    if (!o.is_open()) {
      throw std::runtime_error("Could not open " + path.string() +
                               " for writing");
    }
    o << std::setw(4) << j << std::endl;
    if (!o.good()) {
      throw std::runtime_error("Failed while writing " + path.string());
    }
  };

  dump(LOSS_FILE, record.loss_history);
  dump(FLUCTUATION_FILE, record.fluctuation_history);
  dump(PARAMS_FILE, record.params_history);
  dump(DBI_ENERGIES_FILE, record.dbi_energies);
  dump(DBI_FLUCTUATIONS_FILE, record.dbi_fluctuations);
  dump(DBI_STEPS_FILE, record.dbi_step_sizes);
  dump(HAMILTONIAN_FILE, record.hamiltonian);
  dump(METADATA_FILE, record.metadata);

  spdlog::info("[Results] Run saved in: {}", folder.string());
}
