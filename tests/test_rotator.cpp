#include "core/ansatz.hpp"
#include "core/backend.hpp"
#include "core/errors.hpp"
#include "core/hamiltonian.hpp"
#include "core/rotator.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <vector>

TEST(RotatorTest, IdentityCircuitKeepsMatrix) {
  QuestBackend backend(2);
  RyLayer layer(2);
  HamiltonianRotator rotator(backend);
  HamiltonianModel h = HamiltonianModel::from_family("XXZ", 2);

  Eigen::MatrixXcd rotated = rotator.rotate(h, layer, {0.0, 0.0});
  EXPECT_LT((rotated - h.matrix()).norm(), 1e-12);
}

TEST(RotatorTest, CornerEntryIsCircuitEnergy) {
  QuestBackend backend(2);
  HEA hea(2, 2);
  HamiltonianRotator rotator(backend);
  HamiltonianModel h = HamiltonianModel::from_family("XXZ", 2);

  std::vector<double> params(hea.get_num_params());
  for (std::size_t i = 0; i < params.size(); ++i)
    params[i] = 0.3 - 0.07 * (double)i;

  Eigen::MatrixXcd rotated = rotator.rotate(h, hea, params);
  double energy = h.expectation(backend.execute(hea, params));
  EXPECT_NEAR(rotated(0, 0).real(), energy, 1e-10);
  EXPECT_NEAR(rotated(0, 0).imag(), 0.0, 1e-12);

  // Unitary conjugation keeps the spectrum and hermiticity
  HamiltonianModel model(2, rotated);
  Eigen::VectorXd before = h.eigenvalues();
  Eigen::VectorXd after = model.eigenvalues();
  EXPECT_LT((before - after).norm(), 1e-10);
  EXPECT_LT((rotated - rotated.adjoint()).norm(), 1e-14);
}

TEST(RotatorTest, RejectsMismatchedSizes) {
  QuestBackend backend(2);
  HamiltonianRotator rotator(backend);
  HamiltonianModel h = HamiltonianModel::from_family("XXZ", 2);

  HEA wide(3, 1);
  EXPECT_THROW(
      rotator.rotate(h, wide, std::vector<double>(wide.get_num_params(), 0.0)),
      DimensionMismatchError);

  RyLayer layer(2);
  EXPECT_THROW(rotator.rotate(h, layer, {0.0}), ConfigurationError);
}
