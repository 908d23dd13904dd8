#include "core/errors.hpp"
#include "core/hamiltonian.hpp"
#include "test_helpers.hpp"
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

TEST(HamiltonianTest, XXZTwoQubitGroundEnergy) {
  // Periodic chain of 2 sites counts the bond twice: H = 2(XX + YY + 0.5 ZZ)
  // Singlet energy 2(-2 - 0.5) = -5
  HamiltonianModel h = HamiltonianModel::from_family("XXZ", 2);
  EXPECT_EQ(h.nqubits(), 2);
  EXPECT_EQ(h.dimension(), 4);
  EXPECT_NEAR(h.ground_energy(), -5.0, 1e-10);

  Eigen::VectorXd spectrum = h.eigenvalues();
  EXPECT_NEAR(spectrum(3), 3.0, 1e-10);
}

TEST(HamiltonianTest, SingleQubitFamilies) {
  EXPECT_NEAR(HamiltonianModel::from_family("X", 3).ground_energy(), -3.0,
              1e-10);
  EXPECT_NEAR(HamiltonianModel::from_family("Y", 1).ground_energy(), -1.0,
              1e-10);
  EXPECT_NEAR(HamiltonianModel::from_family("TFIM", 3).ground_energy(), -3.0,
              1e-10);
}

TEST(HamiltonianTest, QubitZeroIsLowestBit) {
  HamiltonianModel h = HamiltonianModel::from_pauli_terms(2, {{1.0, "Z0"}});
  Eigen::VectorXcd diag = h.matrix().diagonal();
  EXPECT_NEAR(diag(0).real(), 1.0, 1e-12);
  EXPECT_NEAR(diag(1).real(), -1.0, 1e-12);
  EXPECT_NEAR(diag(2).real(), 1.0, 1e-12);
  EXPECT_NEAR(diag(3).real(), -1.0, 1e-12);
}

TEST(HamiltonianTest, PauliYMatrix) {
  HamiltonianModel h = HamiltonianModel::from_pauli_terms(1, {{1.0, "Y0"}});
  EXPECT_NEAR(h.matrix()(0, 1).imag(), -1.0, 1e-12);
  EXPECT_NEAR(h.matrix()(1, 0).imag(), 1.0, 1e-12);
}

TEST(HamiltonianTest, ExpectationAndFluctuation) {
  HamiltonianModel z = HamiltonianModel::from_family("Z", 2);
  Eigen::VectorXcd zero = z.zero_state();
  // |00> is an eigenstate of -Z0 - Z1
  EXPECT_NEAR(z.expectation(zero), -2.0, 1e-12);
  EXPECT_NEAR(z.energy_fluctuation(zero), 0.0, 1e-12);

  // <X> = 0 and <H^2> = n on |000> for H = -sum X
  HamiltonianModel x = HamiltonianModel::from_family("X", 3);
  EXPECT_NEAR(x.expectation(x.zero_state()), 0.0, 1e-12);
  EXPECT_NEAR(x.energy_fluctuation(x.zero_state()), std::sqrt(3.0), 1e-12);
}

TEST(HamiltonianTest, OffDiagonalNorm) {
  HamiltonianModel x = HamiltonianModel::from_family("X", 1);
  EXPECT_NEAR(x.off_diagonal_norm(), std::sqrt(2.0), 1e-12);
  EXPECT_NEAR(HamiltonianModel::from_family("Z", 2).off_diagonal_norm(), 0.0,
              1e-12);
}

TEST(HamiltonianTest, RejectsInvalidMatrices) {
  Eigen::MatrixXcd m = Eigen::MatrixXcd::Zero(4, 4);
  m(0, 1) = 1.0; // not Hermitian
  EXPECT_THROW(HamiltonianModel(2, m), ConfigurationError);

  EXPECT_THROW(HamiltonianModel(2, Eigen::MatrixXcd::Identity(3, 3)),
               ConfigurationError);
  EXPECT_THROW(HamiltonianModel(0, Eigen::MatrixXcd::Identity(1, 1)),
               ConfigurationError);
}

TEST(HamiltonianTest, RejectsUnknownFamiliesAndBadTerms) {
  EXPECT_THROW(HamiltonianModel::from_family("Heisenberg", 2),
               ConfigurationError);
  EXPECT_THROW(HamiltonianModel::from_family("XXZ", 1), ConfigurationError);
  EXPECT_THROW(HamiltonianModel::from_pauli_terms(2, {{1.0, "X2"}}),
               ConfigurationError);
  EXPECT_THROW(HamiltonianModel::from_pauli_terms(2, {{1.0, "Q0"}}),
               ConfigurationError);
  EXPECT_THROW(HamiltonianModel::from_pauli_terms(2, {{1.0, "X0 Z0"}}),
               ConfigurationError);
}

TEST(HamiltonianTest, ZeroStateVectorMismatch) {
  HamiltonianModel h = HamiltonianModel::from_family("Z", 2);
  EXPECT_THROW(h.expectation(Eigen::VectorXcd::Zero(2)), ConfigurationError);
}

class HamiltonianFileTest : public ::testing::Test {
protected:
  void SetUp() override {
    path = std::filesystem::temp_directory_path() / "boostvqe_test_ham.json";
  }
  void TearDown() override { std::filesystem::remove(path); }

  void write(const std::string &content) {
    std::ofstream o(path);
    o << content;
  }

  std::filesystem::path path;
};

TEST_F(HamiltonianFileTest, LoadsTermFile) {
  write(R"({
    "n_qubits": 1,
    "basis": "sto-3g",
    "0": {"pauli_string": "Z0", "coefficient": "(0.5+0j)"},
    "1": {"pauli_string": "I", "coefficient": "1.0"}
  })");

  HamiltonianModel h = HamiltonianModel::from_json_file(path.string());
  EXPECT_EQ(h.nqubits(), 1);
  EXPECT_NEAR(h.matrix()(0, 0).real(), 1.5, 1e-12);
  EXPECT_NEAR(h.matrix()(1, 1).real(), 0.5, 1e-12);
}

TEST_F(HamiltonianFileTest, ReportsBrokenFiles) {
  write("{ not json");
  EXPECT_THROW(HamiltonianModel::from_json_file(path.string()),
               ConfigurationError);

  write(R"({"0": {"pauli_string": "Z0", "coefficient": "1"}})");
  EXPECT_THROW(HamiltonianModel::from_json_file(path.string()),
               ConfigurationError);

  EXPECT_THROW(HamiltonianModel::from_json_file("/nonexistent/ham.json"),
               ConfigurationError);
}

TEST_F(HamiltonianFileTest, ImaginaryCoefficients) {
  // "0.5j" and "(0-0.5j)" cancel, leaving the identity
  write(R"({
    "n_qubits": 1,
    "0": {"pauli_string": "Z0", "coefficient": "0.5j"},
    "1": {"pauli_string": "Z0", "coefficient": "(0-0.5j)"},
    "2": {"pauli_string": "I", "coefficient": "1.0"}
  })");
  HamiltonianModel h = HamiltonianModel::from_json_file(path.string());
  EXPECT_LT((h.matrix() - Eigen::MatrixXcd::Identity(2, 2)).norm(), 1e-12);

  // A lone imaginary Z coefficient is not Hermitian
  write(R"({
    "n_qubits": 1,
    "0": {"pauli_string": "Z0", "coefficient": "-0.5j"}
  })");
  EXPECT_THROW(HamiltonianModel::from_json_file(path.string()),
               ConfigurationError);
}

TEST_F(HamiltonianFileTest, RejectsTrailingGarbage) {
  write(R"({
    "n_qubits": 1,
    "0": {"pauli_string": "Z0", "coefficient": "0.25abc"}
  })");
  EXPECT_THROW(HamiltonianModel::from_json_file(path.string()),
               ConfigurationError);

  write(R"({
    "n_qubits": 1,
    "0": {"pauli_string": "Z0", "coefficient": "(0.5+0j)x"}
  })");
  EXPECT_THROW(HamiltonianModel::from_json_file(path.string()),
               ConfigurationError);

  write(R"({
    "n_qubits": 1,
    "0": {"pauli_string": "Z0", "coefficient": "j"}
  })");
  EXPECT_THROW(HamiltonianModel::from_json_file(path.string()),
               ConfigurationError);
}

TEST_F(HamiltonianFileTest, RejectsWrongJsonTypes) {
  write(R"({
    "n_qubits": 1,
    "0": {"pauli_string": 3, "coefficient": "1.0"}
  })");
  EXPECT_THROW(HamiltonianModel::from_json_file(path.string()),
               ConfigurationError);

  write(R"({
    "n_qubits": "one",
    "0": {"pauli_string": "Z0", "coefficient": "1.0"}
  })");
  EXPECT_THROW(HamiltonianModel::from_json_file(path.string()),
               ConfigurationError);

  write(R"({
    "n_qubits": 1,
    "0": {"pauli_string": "Z0", "coefficient": [1.0]}
  })");
  EXPECT_THROW(HamiltonianModel::from_json_file(path.string()),
               ConfigurationError);
}
