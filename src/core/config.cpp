//------------------------------------------------------------------------------
//     AUTHORING
//------------------------------------------------------------------------------
/**
 * @file config.cpp
 * @author Rayan MALEK
 * @date 2026-10-19
 * @brief Implementation of the run configuration.
 */

//------------------------------------------------------------------------------
//     INCLUDES
//------------------------------------------------------------------------------

#include "config.hpp"
#include "backend.hpp"
#include "errors.hpp"
#include "hamiltonian.hpp"
#include "vqe_trainer.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <spdlog/spdlog.h>
#include <sstream>

namespace {

int parse_int(const std::string &key, const std::string &value) {
  try {
    std::size_t pos = 0;
    int v = std::stoi(value, &pos);
    if (pos == value.size())
      return v;
  } catch (const std::exception &) {
  }
  throw ConfigurationError("Option " + key + " expects an integer, got '" +
                           value + "'");
}

double parse_double(const std::string &key, const std::string &value) {
  try {
    std::size_t pos = 0;
    double v = std::stod(value, &pos);
    if (pos == value.size())
      return v;
  } catch (const std::exception &) {
  }
  throw ConfigurationError("Option " + key + " expects a number, got '" +
                           value + "'");
}

unsigned long parse_unsigned(const std::string &key, const std::string &value) {
  try {
    std::size_t pos = 0;
    unsigned long v = std::stoul(value, &pos);
    if (pos == value.size() && value.find('-') == std::string::npos)
      return v;
  } catch (const std::exception &) {
  }
  throw ConfigurationError("Option " + key +
                           " expects a non-negative integer, got '" + value +
                           "'");
}

bool parse_bool(const std::string &key, const std::string &value) {
  std::string v = value;
  std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  if (v == "true" || v == "1" || v == "yes")
    return true;
  if (v == "false" || v == "0" || v == "no")
    return false;
  throw ConfigurationError("Option " + key + " expects true/false, got '" +
                           value + "'");
}

// 64-bit FNV-1a, stable across standard library implementations
std::uint64_t fnv1a(const std::string &text) {
  std::uint64_t h = 14695981039346656037ULL;
  for (unsigned char c : text) {
    h ^= c;
    h *= 1099511628211ULL;
  }
  return h;
}

bool is_unset(const std::string &value) {
  return value.empty() || value == "none" || value == "None" ||
         value == "null";
}

} // namespace

//------------------------------------------------------------------------------
//     PARSING
//------------------------------------------------------------------------------

void Config::set(const std::string &key, const std::string &value) {
  if (key == "backend")
    backend = value;
  else if (key == "nthreads")
    nthreads = parse_int(key, value);
  else if (key == "optimizer")
    optimizer = value;
  else if (key == "tol")
    tol = parse_double(key, value);
  else if (key == "nqubits")
    nqubits = parse_int(key, value);
  else if (key == "nlayers")
    nlayers = parse_int(key, value);
  else if (key == "nboost")
    nboost = parse_int(key, value);
  else if (key == "boost_frequency")
    boost_frequency = is_unset(value)
                          ? std::nullopt
                          : std::optional<int>(parse_int(key, value));
  else if (key == "dbi_steps")
    dbi_steps = parse_int(key, value);
  else if (key == "stepsize")
    stepsize = parse_double(key, value);
  else if (key == "optimize_dbi_step")
    optimize_dbi_step = parse_bool(key, value);
  else if (key == "dbi_objective")
    dbi_objective = value;
  else if (key == "hamiltonian")
    hamiltonian = value;
  else if (key == "hamiltonian_file")
    hamiltonian_file = is_unset(value) ? std::nullopt
                                       : std::optional<std::string>(value);
  else if (key == "output_folder")
    output_folder = is_unset(value) ? std::nullopt
                                    : std::optional<std::string>(value);
  else if (key == "seed")
    seed = parse_unsigned(key, value);
  else if (key == "log_level")
    log_level = value;
  else
    throw ConfigurationError("Unknown option: " + key);
}

Config Config::from_json(const nlohmann::json &j) {
  if (!j.is_object()) {
    throw ConfigurationError("Configuration must be a JSON object");
  }

  Config config;
  for (auto &[key, value] : j.items()) {
    if (value.is_null()) {
      config.set(key, "none");
    } else if (value.is_string()) {
      config.set(key, value.get<std::string>());
    } else if (value.is_boolean()) {
      config.set(key, value.get<bool>() ? "true" : "false");
    } else if (value.is_number()) {
      // dump() keeps integers integral
      config.set(key, value.dump());
    } else {
      throw ConfigurationError("Option " + key + " has an unsupported type");
    }
  }
  return config;
}

Config Config::from_file(const std::string &filename) {
  std::ifstream file(filename);
  if (!file.is_open()) {
    throw ConfigurationError("Could not open configuration file: " + filename);
  }
  nlohmann::json j;
  try {
    file >> j;
  } catch (const nlohmann::json::exception &e) {
    throw ConfigurationError("JSON parsing error in " + filename + ": " +
                             e.what());
  }
  return from_json(j);
}

Config Config::from_args(const std::vector<std::string> &args) {
  std::vector<std::pair<std::string, std::string>> options;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string &arg = args[i];
    if (arg.rfind("--", 0) != 0) {
      throw ConfigurationError("Unexpected argument: " + arg);
    }
    std::string key = arg.substr(2);
    std::string value;
    auto eq = key.find('=');
    if (eq != std::string::npos) {
      value = key.substr(eq + 1);
      key = key.substr(0, eq);
    } else {
      if (i + 1 >= args.size()) {
        throw ConfigurationError("Missing value for --" + key);
      }
      value = args[++i];
    }
    options.emplace_back(key, value);
  }

  Config config;
  auto file = std::find_if(options.begin(), options.end(),
                           [](const auto &o) { return o.first == "config"; });
  if (file != options.end()) {
    config = from_file(file->second);
  }
  for (const auto &[key, value] : options) {
    if (key != "config")
      config.set(key, value);
  }
  return config;
}

//------------------------------------------------------------------------------
//     SERIALIZATION
//------------------------------------------------------------------------------

nlohmann::json Config::to_json() const {
  nlohmann::json j;
  j["backend"] = backend;
  j["nthreads"] = nthreads;
  j["optimizer"] = optimizer;
  j["tol"] = tol;
  j["nqubits"] = nqubits;
  j["nlayers"] = nlayers;
  j["nboost"] = nboost;
  j["boost_frequency"] =
      boost_frequency ? nlohmann::json(*boost_frequency) : nlohmann::json();
  j["dbi_steps"] = dbi_steps;
  j["stepsize"] = stepsize;
  j["optimize_dbi_step"] = optimize_dbi_step;
  j["dbi_objective"] = dbi_objective;
  j["hamiltonian"] = hamiltonian;
  j["hamiltonian_file"] =
      hamiltonian_file ? nlohmann::json(*hamiltonian_file) : nlohmann::json();
  j["output_folder"] =
      output_folder ? nlohmann::json(*output_folder) : nlohmann::json();
  j["seed"] = seed;
  j["log_level"] = log_level;
  return j;
}

//------------------------------------------------------------------------------
//     VALIDATION
//------------------------------------------------------------------------------

void Config::validate() const {
  if (!QuestBackend::is_supported(backend))
    throw ConfigurationError("Unsupported backend: " + backend);
  if (nthreads < 1)
    throw ConfigurationError("nthreads must be >= 1");
  VQETrainer::algorithm_from_name(optimizer);
  if (tol < 0.0)
    throw ConfigurationError("tol must be >= 0");
  if (nqubits <= 0)
    throw ConfigurationError("nqubits must be > 0");
  if (nlayers <= 0)
    throw ConfigurationError("nlayers must be > 0");
  if (nboost < 1)
    throw ConfigurationError("nboost must be >= 1");
  if (boost_frequency && *boost_frequency <= 0)
    throw ConfigurationError("boost_frequency must be > 0 or unset");
  if (dbi_steps < 0)
    throw ConfigurationError("dbi_steps must be >= 0");
  if (!(stepsize > 0.0))
    throw ConfigurationError("stepsize must be > 0");
  dbi_objective_from_name(dbi_objective);
  if (!hamiltonian_file) {
    const auto &names = HamiltonianModel::family_names();
    if (std::find(names.begin(), names.end(), hamiltonian) == names.end())
      throw ConfigurationError("Unknown Hamiltonian family: " + hamiltonian);
  }
  static const std::vector<std::string> levels = {
      "trace", "debug", "info", "warning", "warn", "error", "critical", "off"};
  if (std::find(levels.begin(), levels.end(), log_level) == levels.end())
    throw ConfigurationError("Unknown log level: " + log_level);
}

//------------------------------------------------------------------------------
//     DERIVED VALUES
//------------------------------------------------------------------------------

std::string Config::hash() const {
  nlohmann::json j = to_json();
  // Output location, verbosity and threading do not change the numbers
  j.erase("output_folder");
  j.erase("log_level");
  j.erase("nthreads");

  std::stringstream ss;
  ss << std::hex << std::setw(16) << std::setfill('0') << fnv1a(j.dump());
  return ss.str();
}

std::filesystem::path Config::output_path() const {
  if (output_folder)
    return std::filesystem::path(*output_folder);
  return std::filesystem::path("results") / hash();
}

HamiltonianModel Config::hamiltonian_model() const {
  if (hamiltonian_file) {
    HamiltonianModel h = HamiltonianModel::from_json_file(*hamiltonian_file);
    if (h.nqubits() != nqubits) {
      throw ConfigurationError("Hamiltonian file has " +
                               std::to_string(h.nqubits()) +
                               " qubits but nqubits is " +
                               std::to_string(nqubits));
    }
    return h;
  }
  return HamiltonianModel::from_family(hamiltonian, nqubits);
}

BoostSettings Config::boost_settings() const {
  BoostSettings settings;
  settings.nboost = nboost;
  settings.train_iterations = boost_frequency;
  settings.dbi_steps = dbi_steps;
  settings.optimize_dbi_step = optimize_dbi_step;
  settings.optimizer = optimizer;
  settings.tolerance = tol;
  return settings;
}

DbiSettings Config::dbi_settings() const {
  DbiSettings settings;
  settings.step = stepsize;
  settings.objective = dbi_objective_from_name(dbi_objective);
  return settings;
}

std::string Config::usage() {
  return "Usage: boostvqe_cli [--config file.json] [--key value ...]\n"
         "  --backend quest          execution backend\n"
         "  --nthreads N             worker threads (>= 1)\n"
         "  --optimizer NAME         Powell, Nelder-Mead, COBYLA, BOBYQA, "
         "sbplx, praxis\n"
         "  --tol X                  optimizer tolerance (>= 0)\n"
         "  --nqubits N --nlayers N  circuit size\n"
         "  --nboost N               boosting rounds (>= 1)\n"
         "  --boost_frequency N      optimizer evaluations per round\n"
         "  --dbi_steps N            DBI steps per round (>= 0)\n"
         "  --stepsize X             fixed DBI step size\n"
         "  --optimize_dbi_step B    search the DBI step size\n"
         "  --dbi_objective NAME     energy, off_diagonal_norm, "
         "energy_fluctuation\n"
         "  --hamiltonian NAME       XXZ, TFIM, X, Y, Z\n"
         "  --hamiltonian_file PATH  JSON Pauli-term Hamiltonian\n"
         "  --output_folder PATH     defaults to results/<config hash>\n"
         "  --seed N                 random seed\n"
         "  --log_level LEVEL        trace, debug, info, warn, error\n";
}
