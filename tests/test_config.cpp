#include "core/config.hpp"
#include "core/errors.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <vector>

TEST(ConfigTest, DefaultsAreValid) {
  Config config;
  EXPECT_NO_THROW(config.validate());
  EXPECT_EQ(config.backend, "quest");
  EXPECT_EQ(config.optimizer, "Powell");
  EXPECT_EQ(config.nboost, 1);
  EXPECT_FALSE(config.boost_frequency.has_value());
  EXPECT_DOUBLE_EQ(config.stepsize, 0.01);
}

TEST(ConfigTest, ParsesArguments) {
  Config config = Config::from_args(
      {"--nqubits", "4", "--optimize_dbi_step=true", "--boost_frequency",
       "10", "--hamiltonian", "TFIM", "--tol", "1e-4", "--seed", "123"});

  EXPECT_EQ(config.nqubits, 4);
  EXPECT_TRUE(config.optimize_dbi_step);
  ASSERT_TRUE(config.boost_frequency.has_value());
  EXPECT_EQ(*config.boost_frequency, 10);
  EXPECT_EQ(config.hamiltonian, "TFIM");
  EXPECT_DOUBLE_EQ(config.tol, 1e-4);
  EXPECT_EQ(config.seed, 123ul);
  EXPECT_NO_THROW(config.validate());

  config.set("boost_frequency", "None");
  EXPECT_FALSE(config.boost_frequency.has_value());
}

TEST(ConfigTest, RejectsMalformedArguments) {
  EXPECT_THROW(Config::from_args({"--nqubits"}), ConfigurationError);
  EXPECT_THROW(Config::from_args({"nqubits", "3"}), ConfigurationError);
  EXPECT_THROW(Config::from_args({"--nqubits", "three"}), ConfigurationError);
  EXPECT_THROW(Config::from_args({"--nqubits", "3.5"}), ConfigurationError);
  EXPECT_THROW(Config::from_args({"--colour", "red"}), ConfigurationError);
  EXPECT_THROW(Config::from_args({"--optimize_dbi_step", "maybe"}),
               ConfigurationError);
  EXPECT_THROW(Config::from_args({"--seed", "-4"}), ConfigurationError);
}

TEST(ConfigTest, ValidationFailures) {
  auto invalid = [](const std::string &key, const std::string &value) {
    Config config;
    config.set(key, value);
    return config;
  };

  EXPECT_THROW(invalid("nboost", "0").validate(), ConfigurationError);
  EXPECT_THROW(invalid("dbi_steps", "-1").validate(), ConfigurationError);
  EXPECT_THROW(invalid("tol", "-0.1").validate(), ConfigurationError);
  EXPECT_THROW(invalid("backend", "numpy").validate(), ConfigurationError);
  EXPECT_THROW(invalid("optimizer", "sgd").validate(), ConfigurationError);
  EXPECT_THROW(invalid("hamiltonian", "Hubbard").validate(),
               ConfigurationError);
  EXPECT_THROW(invalid("boost_frequency", "0").validate(), ConfigurationError);
  EXPECT_THROW(invalid("dbi_objective", "gap").validate(), ConfigurationError);
  EXPECT_THROW(invalid("nthreads", "0").validate(), ConfigurationError);

  // Zero DBI steps is a plain VQE run
  EXPECT_NO_THROW(invalid("dbi_steps", "0").validate());
}

TEST(ConfigTest, HashIdentifiesRun) {
  Config a;
  Config b;
  EXPECT_EQ(a.hash(), b.hash());

  b.output_folder = "/tmp/elsewhere";
  b.log_level = "debug";
  EXPECT_EQ(a.hash(), b.hash());

  b.nqubits = 3;
  EXPECT_NE(a.hash(), b.hash());

  EXPECT_EQ(a.output_path(), std::filesystem::path("results") / a.hash());
  EXPECT_EQ(b.output_path(), std::filesystem::path("/tmp/elsewhere"));
}

TEST(ConfigTest, JsonRoundTrip) {
  Config config = Config::from_args({"--nboost", "3", "--stepsize", "0.05"});
  Config copy = Config::from_json(config.to_json());
  EXPECT_EQ(copy.to_json(), config.to_json());
  EXPECT_EQ(copy.hash(), config.hash());

  EXPECT_THROW(Config::from_json({{"bogus", 1}}), ConfigurationError);
  EXPECT_THROW(Config::from_json(nlohmann::json::array()), ConfigurationError);
}

TEST(ConfigTest, FileThenOverrides) {
  std::filesystem::path path =
      std::filesystem::temp_directory_path() / "boostvqe_test_config.json";
  {
    std::ofstream o(path);
    o << R"({"nqubits": 3, "nlayers": 2, "optimizer": "COBYLA"})";
  }

  Config config =
      Config::from_args({"--nlayers", "4", "--config", path.string()});
  EXPECT_EQ(config.nqubits, 3);
  EXPECT_EQ(config.nlayers, 4);
  EXPECT_EQ(config.optimizer, "COBYLA");
  std::filesystem::remove(path);

  EXPECT_THROW(Config::from_file("/nonexistent/config.json"),
               ConfigurationError);
}

TEST(ConfigTest, DerivedSettings) {
  Config config = Config::from_args({"--nboost", "2", "--boost_frequency",
                                     "25", "--dbi_steps", "3", "--stepsize",
                                     "0.02", "--dbi_objective",
                                     "off_diagonal_norm"});

  BoostSettings boost = config.boost_settings();
  EXPECT_EQ(boost.nboost, 2);
  ASSERT_TRUE(boost.train_iterations.has_value());
  EXPECT_EQ(*boost.train_iterations, 25);
  EXPECT_EQ(boost.dbi_steps, 3);
  EXPECT_EQ(boost.optimizer, "Powell");

  DbiSettings dbi = config.dbi_settings();
  EXPECT_DOUBLE_EQ(dbi.step, 0.02);
  EXPECT_EQ(dbi.objective, DbiObjective::OffDiagonalNorm);
}

TEST(ConfigTest, HashIsToolchainIndependent) {
  // FNV-1a of the serialized defaults
  EXPECT_EQ(Config().hash(), "1978cd27746be78a");
  EXPECT_EQ(Config().output_path(),
            std::filesystem::path("results") / "1978cd27746be78a");
}

TEST(ConfigTest, BooleanSpellings) {
  Config config;
  config.set("optimize_dbi_step", "TRUE");
  EXPECT_TRUE(config.optimize_dbi_step);
  config.set("optimize_dbi_step", "No");
  EXPECT_FALSE(config.optimize_dbi_step);

  EXPECT_THROW(config.set("optimize_dbi_step", "\xe9t\xe9"), ConfigurationError);
}

TEST(ConfigTest, HamiltonianFileMustMatchRegister) {
  std::filesystem::path path =
      std::filesystem::temp_directory_path() / "boostvqe_test_config_ham.json";
  {
    std::ofstream o(path);
    o << R"({"n_qubits": 1, "0": {"pauli_string": "Z0", "coefficient": "1.0"}})";
  }

  Config config;
  config.hamiltonian_file = path.string();
  config.nqubits = 2;
  EXPECT_THROW(config.hamiltonian_model(), ConfigurationError);

  config.nqubits = 1;
  EXPECT_EQ(config.hamiltonian_model().nqubits(), 1);
  std::filesystem::remove(path);

  Config family;
  family.nqubits = 2;
  EXPECT_NEAR(family.hamiltonian_model().ground_energy(), -5.0, 1e-10);
}
