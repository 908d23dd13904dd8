//------------------------------------------------------------------------------
//     AUTHORING
//------------------------------------------------------------------------------
/**
 * @file config.hpp
 * @author Rayan MALEK
 * @date 2026-10-19
 * @brief Run configuration: JSON file, command line overrides, validation.
 */

#pragma once

//------------------------------------------------------------------------------
//     INCLUDES
//------------------------------------------------------------------------------

#include "boosting.hpp"
#include "dbi.hpp"
#include "hamiltonian.hpp"
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

//------------------------------------------------------------------------------
//     STRUCTS
//------------------------------------------------------------------------------

/**
 * @struct Config
 * @brief All options of a boosted VQE run.
 *
 * Field names are the JSON keys and the command line flags (--nqubits 4).
 */
struct Config {
  std::string backend = "quest";
  int nthreads = 1;
  std::string optimizer = "Powell";
  double tol = 1e-2;
  int nqubits = 6;
  int nlayers = 5;
  int nboost = 1;
  std::optional<int> boost_frequency; ///< Unbounded when unset.
  int dbi_steps = 1;
  double stepsize = 0.01;
  bool optimize_dbi_step = false;
  std::string dbi_objective = "energy";
  std::string hamiltonian = "XXZ";
  std::optional<std::string> hamiltonian_file;
  std::optional<std::string> output_folder;
  unsigned long seed = 42;
  std::string log_level = "info";

  /**
   * @brief Reads a configuration object; unknown keys are rejected.
   * @throws ConfigurationError on unknown keys or wrong value types.
   */
  static Config from_json(const nlohmann::json &j);

  /**
   * @brief Loads "--config <file>" (if any) and applies "--key value" /
   * "--key=value" overrides on top, in order.
   * @throws ConfigurationError on unknown flags or unparsable values.
   */
  static Config from_args(const std::vector<std::string> &args);

  static Config from_file(const std::string &filename);

  /**
   * @brief Sets one option from its textual value.
   */
  void set(const std::string &key, const std::string &value);

  nlohmann::json to_json() const;

  /**
   * @throws ConfigurationError describing the first invalid option.
   */
  void validate() const;

  /**
   * @brief Hex digest of the options that influence the numerics.
   */
  std::string hash() const;

  /**
   * @brief output_folder, or results/<hash> when unset.
   */
  std::filesystem::path output_path() const;

  /**
   * @brief Named family or file Hamiltonian; a file must match nqubits.
   */
  HamiltonianModel hamiltonian_model() const;

  BoostSettings boost_settings() const;
  DbiSettings dbi_settings() const;

  static std::string usage();
};
