//------------------------------------------------------------------------------
//     AUTHORING
//------------------------------------------------------------------------------
/**
 * @file results.hpp
 * @author Rayan MALEK
 * @date 2026-10-19
 * @brief Aggregation and JSON persistence of a boosting run.
 */

#pragma once

//------------------------------------------------------------------------------
//     INCLUDES
//------------------------------------------------------------------------------

#include "boosting.hpp"
#include "hamiltonian.hpp"
#include <Eigen/Dense>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

//------------------------------------------------------------------------------
//     STRUCTS
//------------------------------------------------------------------------------

/**
 * @struct RunRecord
 * @brief Persistable view of a run. History objects are keyed by round
 * index ("0", "1", ...).
 */
struct RunRecord {
  nlohmann::json metadata;
  nlohmann::json loss_history;
  nlohmann::json fluctuation_history;
  nlohmann::json params_history;
  nlohmann::json dbi_energies;
  nlohmann::json dbi_fluctuations;
  nlohmann::json dbi_step_sizes;
  nlohmann::json hamiltonian; ///< Original Hamiltonian matrix.
};

//------------------------------------------------------------------------------
//     CLASS DECLARATION
//------------------------------------------------------------------------------

/**
 * @class ResultRecorder
 * @brief Assembles configuration, terminal scalars and per-round histories.
 */
class ResultRecorder {
public:
  static constexpr const char *LOSS_FILE = "energies.json";
  static constexpr const char *FLUCTUATION_FILE = "fluctuations.json";
  static constexpr const char *PARAMS_FILE = "parameters_history.json";
  static constexpr const char *DBI_ENERGIES_FILE = "dbi_energies.json";
  static constexpr const char *DBI_FLUCTUATIONS_FILE = "dbi_fluctuations.json";
  static constexpr const char *DBI_STEPS_FILE = "dbi_step_sizes.json";
  static constexpr const char *HAMILTONIAN_FILE = "hamiltonian_matrix.json";
  static constexpr const char *METADATA_FILE = "output.json";

  /**
   * @param config Configuration fields copied into the metadata record.
   */
  explicit ResultRecorder(nlohmann::json config);

  RunRecord finalize(const RunResult &result,
                     const HamiltonianModel &original) const;

  /**
   * @brief Writes every file of @p record into @p folder (created if needed).
   * @throws std::runtime_error if a file cannot be written.
   */
  static void write(const RunRecord &record,
                    const std::filesystem::path &folder);

  /**
   * @brief Stable key of a round index.
   */
  static std::string round_key(int round);

  static nlohmann::json matrix_to_json(const Eigen::MatrixXcd &matrix);

private:
  nlohmann::json config;
};
