//------------------------------------------------------------------------------
//     AUTHORING
//------------------------------------------------------------------------------
/**
 * @file main_cli.cpp
 * @author Rayan MALEK
 * @date 2026-10-19
 * @brief Command line driver: VQE training boosted by double-bracket
 * iterations.
 */

#include "core/ansatz.hpp"
#include "core/backend.hpp"
#include "core/boosting.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/hamiltonian.hpp"
#include "core/logger.hpp"
#include "core/results.hpp"
#include <filesystem>
#include <iostream>
#include <quest.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace {

int run(const Config &config) {
  // build hamiltonian and variational quantum circuit before touching disk
  HamiltonianModel hamiltonian = config.hamiltonian_model();
  HEA circuit(config.nqubits, config.nlayers);

  // setup the results folder
  std::filesystem::path path = config.output_path();
  std::filesystem::create_directories(path);
  bv_log::init_logger(config.log_level, (path / "run.log").string());
  spdlog::info(">>> Boosted VQE, results in {} <<<", path.string());
  spdlog::info("[CLI] {} ({} parameters)", circuit.get_name(),
               circuit.get_num_params());

  QuestBackend::set_num_threads(config.nthreads);

  QuestBackend backend(config.nqubits);
  BoostingOrchestrator orchestrator(backend, circuit, config.dbi_settings(),
                                    config.seed);

  RunResult result = orchestrator.run(hamiltonian, config.boost_settings());

  ResultRecorder recorder(config.to_json());
  RunRecord record = recorder.finalize(result, hamiltonian);
  spdlog::info("[CLI] Dump the results");
  ResultRecorder::write(record, path);
  return 0;
}

} // namespace

int main(int argc, char **argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  for (const auto &arg : args) {
    if (arg == "--help" || arg == "-h") {
      std::cout << Config::usage();
      return 0;
    }
  }

  bv_log::init_logger();

  Config config;
  try {
    config = Config::from_args(args);
    config.validate();
  } catch (const ConfigurationError &e) {
    spdlog::critical("Configuration error: {}", e.what());
    std::cerr << Config::usage();
    return 2;
  }

  int status = 1;
  QuestBackend::ensure_environment();
  try {
    status = run(config);
  } catch (const ConfigurationError &e) {
    spdlog::critical("Configuration error: {}", e.what());
    status = 2;
  } catch (const BoostError &e) {
    // Nothing is persisted for a failed run
    spdlog::critical("Run aborted: {}", e.what());
  } catch (const std::exception &e) {
    spdlog::critical("Unexpected failure: {}", e.what());
  }
  finalizeQuESTEnv();
  return status;
}
