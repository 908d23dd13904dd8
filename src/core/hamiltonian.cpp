//------------------------------------------------------------------------------
//     AUTHORING
//------------------------------------------------------------------------------
/**
 * @file hamiltonian.cpp
 * @author Rayan MALEK
 * @date 2026-10-19
 * @brief Implementation of HamiltonianModel: construction, loading and
 * observables.
 */

//------------------------------------------------------------------------------
//     INCLUDES
//------------------------------------------------------------------------------

#include "hamiltonian.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <sstream>

namespace {

constexpr double HERMITICITY_TOL = 1e-8;

// XXZ anisotropy and TFIM transverse field
constexpr double XXZ_DELTA = 0.5;
constexpr double TFIM_FIELD = 0.0;

std::string two_site(char op, int a, int b) {
  return std::string(1, op) + std::to_string(a) + " " + std::string(1, op) +
         std::to_string(b);
}

std::string one_site(char op, int a) {
  return std::string(1, op) + std::to_string(a);
}

} // namespace

//------------------------------------------------------------------------------
//     CONSTRUCTORS
//------------------------------------------------------------------------------

HamiltonianModel::HamiltonianModel(int nqubits, Eigen::MatrixXcd matrix)
    : num_qubits(nqubits), h(std::move(matrix)) {
  if (num_qubits <= 0 || num_qubits > 30) {
    throw ConfigurationError("Invalid qubit count: " +
                             std::to_string(num_qubits));
  }
  const long long dim = 1LL << num_qubits;
  if (h.rows() != dim || h.cols() != dim) {
    throw ConfigurationError("Hamiltonian matrix is " +
                             std::to_string(h.rows()) + "x" +
                             std::to_string(h.cols()) + ", expected " +
                             std::to_string(dim) + "x" + std::to_string(dim));
  }

  double asym = (h - h.adjoint()).norm();
  if (!(asym <= HERMITICITY_TOL * std::max(1.0, h.norm()))) {
    throw ConfigurationError("Hamiltonian matrix is not Hermitian (|H - H^+| = " +
                             std::to_string(asym) + ")");
  }
}

const std::vector<std::string> &HamiltonianModel::family_names() {
  static const std::vector<std::string> names = {"XXZ", "TFIM", "X", "Y",
                                                 "Z"};
  return names;
}

HamiltonianModel HamiltonianModel::from_family(const std::string &name,
                                               int nqubits) {
  spdlog::trace("Entering HamiltonianModel::from_family({}, {})", name,
                nqubits);

  if (nqubits <= 0) {
    throw ConfigurationError("nqubits must be positive, got " +
                             std::to_string(nqubits));
  }

  std::vector<PauliTerm> terms;

  if (name == "XXZ" || name == "TFIM") {
    if (nqubits < 2) {
      throw ConfigurationError(name + " needs at least 2 qubits");
    }
    // Periodic chain
    for (int k = 0; k < nqubits; ++k) {
      int next = (k + 1) % nqubits;
      if (name == "XXZ") {
        terms.push_back({1.0, two_site('X', k, next)});
        terms.push_back({1.0, two_site('Y', k, next)});
        terms.push_back({XXZ_DELTA, two_site('Z', k, next)});
      } else {
        terms.push_back({-1.0, two_site('Z', k, next)});
        if (TFIM_FIELD != 0.0)
          terms.push_back({-TFIM_FIELD, one_site('X', k)});
      }
    }
  } else if (name == "X" || name == "Y" || name == "Z") {
    for (int k = 0; k < nqubits; ++k) {
      terms.push_back({-1.0, one_site(name[0], k)});
    }
  } else {
    throw ConfigurationError("Unknown Hamiltonian family: " + name);
  }

  spdlog::info("[Hamiltonian] Built {} on {} qubits ({} terms)", name, nqubits,
               terms.size());
  return from_pauli_terms(nqubits, terms);
}

HamiltonianModel
HamiltonianModel::from_pauli_terms(int nqubits,
                                   const std::vector<PauliTerm> &terms) {
  if (nqubits <= 0 || nqubits > 30) {
    throw ConfigurationError("Invalid qubit count: " + std::to_string(nqubits));
  }
  const long long dim = 1LL << nqubits;
  Eigen::MatrixXcd matrix = Eigen::MatrixXcd::Zero(dim, dim);
  const std::complex<double> I(0.0, 1.0);

  for (const auto &term : terms) {
    // codes[q]: 0=I, 1=X, 2=Y, 3=Z
    std::vector<int> codes(nqubits, 0);
    std::stringstream ss(term.pauli);
    std::string token;
    while (ss >> token) {
      if (token == "I")
        continue;
      if (token.length() < 2) {
        throw ConfigurationError("Malformed Pauli token '" + token + "' in '" +
                                 term.pauli + "'");
      }
      char op = token[0];
      int idx = 0;
      try {
        idx = std::stoi(token.substr(1));
      } catch (const std::exception &) {
        throw ConfigurationError("Malformed Pauli token '" + token + "'");
      }
      if (idx < 0 || idx >= nqubits) {
        throw ConfigurationError("Pauli token '" + token +
                                 "' is outside the register of " +
                                 std::to_string(nqubits) + " qubits");
      }
      int code = 0;
      switch (op) {
      case 'I':
        code = 0;
        break;
      case 'X':
        code = 1;
        break;
      case 'Y':
        code = 2;
        break;
      case 'Z':
        code = 3;
        break;
      default:
        throw ConfigurationError("Unknown Pauli operator in '" + token + "'");
      }
      if (code == 0)
        continue;
      if (codes[idx] != 0) {
        throw ConfigurationError("Qubit " + std::to_string(idx) +
                                 " appears twice in '" + term.pauli + "'");
      }
      codes[idx] = code;
    }

    long long flip = 0;
    for (int q = 0; q < nqubits; ++q) {
      if (codes[q] == 1 || codes[q] == 2)
        flip |= (1LL << q);
    }

    // P|j> = phase * |j ^ flip>
    for (long long j = 0; j < dim; ++j) {
      std::complex<double> phase = 1.0;
      for (int q = 0; q < nqubits; ++q) {
        bool bit = (j >> q) & 1LL;
        if (codes[q] == 2)
          phase *= bit ? -I : I;
        else if (codes[q] == 3 && bit)
          phase = -phase;
      }
      matrix(j ^ flip, j) += term.coeff * phase;
    }
  }

  return HamiltonianModel(nqubits, std::move(matrix));
}

//------------------------------------------------------------------------------
//     LOADER
//------------------------------------------------------------------------------

std::complex<double>
HamiltonianModel::parse_coefficient(const std::string &coeff_str) {
  auto fail = [&coeff_str]() {
    return ConfigurationError("Cannot parse coefficient: '" + coeff_str + "'");
  };
  // The whole string must be a number
  auto to_double = [&fail](const std::string &s) {
    std::size_t pos = 0;
    double v = 0.0;
    try {
      v = std::stod(s, &pos);
    } catch (const std::exception &) {
      throw fail();
    }
    if (pos != s.size())
      throw fail();
    return v;
  };

  if (coeff_str.empty())
    throw fail();

  // "(re+imj)"
  if (coeff_str.front() == '(') {
    double real = 0.0, imag = 0.0;
    int consumed = 0;
    if (std::sscanf(coeff_str.c_str(), "(%lf%lfj)%n", &real, &imag,
                    &consumed) != 2 ||
        consumed != (int)coeff_str.size()) {
      throw fail();
    }
    return {real, imag};
  }

  // "0.5j" or "-0.25j"
  if (coeff_str.back() == 'j') {
    return {0.0, to_double(coeff_str.substr(0, coeff_str.size() - 1))};
  }

  return {to_double(coeff_str), 0.0};
}

HamiltonianModel HamiltonianModel::from_json_file(const std::string &filename) {
  spdlog::trace("Entering HamiltonianModel::from_json_file() to parse: {}",
                filename);
  spdlog::info(">>> Loading Hamiltonian from {} <<<", filename);

  std::ifstream file(filename);
  if (!file.is_open()) {
    throw ConfigurationError("Could not open Hamiltonian file: " + filename);
  }

  nlohmann::json j;
  int num_qubits = 0;
  std::vector<PauliTerm> terms;
  try {
    file >> j;

    if (!j.is_object() || !j.contains("n_qubits")) {
      throw ConfigurationError("n_qubits not found in " + filename);
    }
    if (!j["n_qubits"].is_number_integer()) {
      throw ConfigurationError("n_qubits must be an integer in " + filename);
    }
    num_qubits = j["n_qubits"].get<int>();

    for (auto &[key, term] : j.items()) {
      if (!term.is_object())
        continue;
      if (!term.contains("pauli_string") || !term.contains("coefficient"))
        continue;

      const auto &coeff = term["coefficient"];
      std::complex<double> c =
          coeff.is_number() ? std::complex<double>(coeff.get<double>(), 0.0)
                            : parse_coefficient(coeff.get<std::string>());
      terms.push_back({c, term["pauli_string"].get<std::string>()});
    }
  } catch (const nlohmann::json::exception &e) {
    throw ConfigurationError("Malformed Hamiltonian file " + filename + ": " +
                             e.what());
  }

  if (terms.empty()) {
    throw ConfigurationError("No Pauli terms found in " + filename);
  }

  spdlog::info("Hamiltonian loaded: {} qubits, {} terms", num_qubits,
               terms.size());
  return from_pauli_terms(num_qubits, terms);
}

//------------------------------------------------------------------------------
//     OBSERVABLES
//------------------------------------------------------------------------------

double HamiltonianModel::expectation(const Eigen::VectorXcd &state) const {
  if (state.size() != h.rows()) {
    throw ConfigurationError("State of size " + std::to_string(state.size()) +
                             " does not match Hamiltonian dimension " +
                             std::to_string(h.rows()));
  }
  return state.dot(h * state).real();
}

double
HamiltonianModel::energy_fluctuation(const Eigen::VectorXcd &state) const {
  if (state.size() != h.rows()) {
    throw ConfigurationError("State of size " + std::to_string(state.size()) +
                             " does not match Hamiltonian dimension " +
                             std::to_string(h.rows()));
  }
  double norm2 = state.squaredNorm();
  Eigen::VectorXcd h_state = h * state;
  double avg_h = state.dot(h_state).real() / norm2;
  // <H^2> = |H psi|^2 for Hermitian H
  double avg_h2 = h_state.squaredNorm() / norm2;
  return std::sqrt(std::abs(avg_h2 - avg_h * avg_h));
}

Eigen::VectorXd HamiltonianModel::eigenvalues() const {
  Eigen::SelfAdjointEigenSolver<Eigen::MatrixXcd> solver(
      h, Eigen::EigenvaluesOnly);
  if (solver.info() != Eigen::Success) {
    throw NumericalInstabilityError("Eigen-decomposition of the Hamiltonian "
                                    "did not converge");
  }
  return solver.eigenvalues();
}

double HamiltonianModel::ground_energy() const {
  return eigenvalues().minCoeff();
}

double HamiltonianModel::off_diagonal_norm() const {
  Eigen::MatrixXcd off = h;
  off.diagonal().setZero();
  return off.norm();
}

Eigen::VectorXcd HamiltonianModel::zero_state() const {
  Eigen::VectorXcd state = Eigen::VectorXcd::Zero(h.rows());
  state(0) = 1.0;
  return state;
}
