#include "core/boosting.hpp"
#include "core/hamiltonian.hpp"
#include "core/results.hpp"
#include "core/vqe_trainer.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

class ResultRecorderTest : public ::testing::Test {
protected:
  ResultRecorderTest() : original(HamiltonianModel::from_family("Z", 1)) {
    for (int b = 0; b < 2; ++b) {
      OptimizationTrace trace;
      trace.record({0.1 * b, 0.2}, -0.5 - b, 0.3);
      trace.record({0.2 * b, 0.1}, -0.7 - b, 0.2);

      OptimizerResult optimizer{-0.7 - b, true, "Function tolerance reached.",
                                2};
      result.rounds.emplace(
          b, BoostRound{b, trace, optimizer, {0.2 * b, 0.1}, {-0.8 - b},
                        {0.1}, {0.01}, original, original});
    }
    result.energy = -1.8;
    result.fluctuation = 0.1;
    result.success = true;
    result.message = "Function tolerance reached.";
    result.best_loss = -1.7;
    result.true_ground_energy = -1.0;

    folder = fs::temp_directory_path() / "boostvqe_results_test";
    fs::remove_all(folder);
  }

  void TearDown() override { fs::remove_all(folder); }

  HamiltonianModel original;
  RunResult result;
  fs::path folder;
};

TEST_F(ResultRecorderTest, RoundKeys) {
  EXPECT_EQ(ResultRecorder::round_key(0), "0");
  EXPECT_EQ(ResultRecorder::round_key(12), "12");
}

TEST_F(ResultRecorderTest, FinalizeBuildsRecord) {
  ResultRecorder recorder({{"nqubits", 1}, {"optimizer", "Powell"}});
  RunRecord record = recorder.finalize(result, original);

  EXPECT_EQ(record.metadata["nqubits"], 1);
  EXPECT_EQ(record.metadata["optimizer"], "Powell");
  EXPECT_DOUBLE_EQ(record.metadata["best_loss"].get<double>(), -1.7);
  EXPECT_DOUBLE_EQ(record.metadata["true_ground_energy"].get<double>(), -1.0);
  EXPECT_DOUBLE_EQ(record.metadata["energy"].get<double>(), -1.8);
  EXPECT_DOUBLE_EQ(record.metadata["fluctuations"].get<double>(), 0.1);
  EXPECT_TRUE(record.metadata["success"].get<bool>());
  EXPECT_EQ(record.metadata["message"], "Function tolerance reached.");

  ASSERT_TRUE(record.loss_history.contains("0"));
  ASSERT_TRUE(record.loss_history.contains("1"));
  EXPECT_EQ(record.loss_history["1"].size(), 2u);
  EXPECT_DOUBLE_EQ(record.loss_history["1"][1].get<double>(), -1.7);
  EXPECT_EQ(record.params_history["0"][0].size(), 2u);
  EXPECT_EQ(record.dbi_step_sizes["0"].size(), 1u);
  EXPECT_EQ(record.dbi_fluctuations.size(), 2u);

  EXPECT_EQ(record.hamiltonian["rows"], 2);
  EXPECT_DOUBLE_EQ(record.hamiltonian["real"][1][1].get<double>(), 1.0);
}

TEST_F(ResultRecorderTest, WritesAllFiles) {
  ResultRecorder recorder(nlohmann::json::object());
  ResultRecorder::write(recorder.finalize(result, original), folder);

  for (const char *name :
       {ResultRecorder::LOSS_FILE, ResultRecorder::FLUCTUATION_FILE,
        ResultRecorder::PARAMS_FILE, ResultRecorder::DBI_ENERGIES_FILE,
        ResultRecorder::DBI_FLUCTUATIONS_FILE, ResultRecorder::DBI_STEPS_FILE,
        ResultRecorder::HAMILTONIAN_FILE, ResultRecorder::METADATA_FILE}) {
    EXPECT_TRUE(fs::exists(folder / name)) << name;
  }

  std::ifstream in(folder / ResultRecorder::METADATA_FILE);
  nlohmann::json metadata = nlohmann::json::parse(in);
  EXPECT_DOUBLE_EQ(metadata["energy"].get<double>(), -1.8);
}
