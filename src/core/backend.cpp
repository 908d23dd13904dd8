//------------------------------------------------------------------------------
//     AUTHORING
//------------------------------------------------------------------------------
/**
 * @file backend.cpp
 * @author Rayan MALEK
 * @date 2026-10-19
 * @brief Implementation of the QuEST backend.
 */

//------------------------------------------------------------------------------
//     INCLUDES
//------------------------------------------------------------------------------

#include "backend.hpp"
#include "errors.hpp"
#include <complex>
#include <omp.h>
#include <spdlog/spdlog.h>

//------------------------------------------------------------------------------
//     CONSTRUCTOR / DESTRUCTOR
//------------------------------------------------------------------------------

QuestBackend::QuestBackend(int num_qubits) : num_qubits(num_qubits) {
  if (num_qubits <= 0) {
    throw ConfigurationError("Backend needs a positive qubit count, got " +
                             std::to_string(num_qubits));
  }
  ensure_environment();
  qubits = createQureg(num_qubits);
  spdlog::debug("[Backend] Allocated QuEST register of {} qubits", num_qubits);
}

QuestBackend::~QuestBackend() { destroyQureg(qubits); }

//------------------------------------------------------------------------------
//     ENVIRONMENT
//------------------------------------------------------------------------------

void QuestBackend::ensure_environment() {
  if (!isQuESTEnvInit()) {
    initQuESTEnv();
    spdlog::debug("[Backend] QuEST environment initialized");
  }
}

bool QuestBackend::is_supported(const std::string &name) {
  return name == "quest";
}

void QuestBackend::set_num_threads(int nthreads) {
  if (nthreads < 1) {
    throw ConfigurationError("nthreads must be >= 1, got " +
                             std::to_string(nthreads));
  }
  omp_set_num_threads(nthreads);
  Eigen::setNbThreads(nthreads);
  spdlog::info("[Backend] Using {} thread(s)", nthreads);
}

//------------------------------------------------------------------------------
//     EXECUTION
//------------------------------------------------------------------------------

void QuestBackend::check_register(const Ansatz &ansatz) const {
  if (ansatz.get_num_qubits() != num_qubits) {
    throw DimensionMismatchError(
        "Ansatz acts on " + std::to_string(ansatz.get_num_qubits()) +
        " qubits but the backend register has " + std::to_string(num_qubits));
  }
}

Eigen::VectorXcd QuestBackend::read_amplitudes() const {
  const long long dim = 1LL << num_qubits;
  std::vector<qcomp> amps(dim);
  getQuregAmps(amps.data(), qubits, 0, dim);

  Eigen::VectorXcd state(dim);
  for (long long j = 0; j < dim; ++j) {
    state(j) = std::complex<double>(amps[j].real(), amps[j].imag());
  }
  return state;
}

Eigen::VectorXcd QuestBackend::execute(const Ansatz &ansatz,
                                       const std::vector<double> &params) {
  check_register(ansatz);
  initZeroState(qubits);
  ansatz.construct_circuit(qubits, params);
  return read_amplitudes();
}

Eigen::MatrixXcd QuestBackend::unitary(const Ansatz &ansatz,
                                       const std::vector<double> &params) {
  check_register(ansatz);
  const long long dim = 1LL << num_qubits;
  Eigen::MatrixXcd u(dim, dim);

  // Column k is U|k>
  for (long long k = 0; k < dim; ++k) {
    initClassicalState(qubits, k);
    ansatz.construct_circuit(qubits, params);
    u.col(k) = read_amplitudes();
  }
  return u;
}
