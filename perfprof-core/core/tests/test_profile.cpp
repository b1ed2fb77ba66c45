#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <perfprof_core/builder.hpp>
#include <perfprof_core/profile.hpp>
#include <sstream>

#include "test_utils.hpp"

using test_utils::make_record;

namespace {

const KeyTuple A{"A"};
const KeyTuple B{"B"};

}  // namespace

class PerformanceProfileTest : public ::testing::Test {
protected:
  void SetUp() override {
    std::vector<BenchmarkRecord> records = {
        make_record("p1", "A", true, 1.0), make_record("p1", "B", true, 4.0),
        make_record("p2", "A", true, 3.0), make_record("p2", "B", true, 1.0),
        make_record("p3", "A", true, 2.0), make_record("p3", "B", false, std::nullopt),
        make_record("p4", "A", false, std::nullopt), make_record("p4", "B", false, std::nullopt),
    };
    auto result = build_profile(records, test_utils::time_config(), std::nullopt, "bench_test");
    ASSERT_TRUE(result.has_value());
    profile_ = std::move(*result);
  }

  PerformanceProfile profile_;
};

// =============================================================================
// Queries
// =============================================================================

TEST_F(PerformanceProfileTest, Ratios) {
  EXPECT_EQ(profile_.ratios(A), (std::vector<double>{1.0, 1.0, 3.0}));
  EXPECT_EQ(profile_.ratios(B), (std::vector<double>{1.0, 4.0}));
  EXPECT_DOUBLE_EQ(profile_.min_ratio(), 1.0);
  EXPECT_DOUBLE_EQ(profile_.max_ratio(), 4.0);
}

TEST_F(PerformanceProfileTest, Counts) {
  EXPECT_EQ(profile_.total_instances(), 3);
  EXPECT_EQ(profile_.attempted_instances(), 4);
  EXPECT_EQ(profile_.n_comparable_runs(), 5);
  EXPECT_EQ(profile_.solved(A), 3);
  EXPECT_EQ(profile_.solved(B), 2);
  EXPECT_EQ(profile_.wins(A), 2);
  EXPECT_EQ(profile_.wins(B), 1);
}

TEST_F(PerformanceProfileTest, FractionWithin) {
  EXPECT_DOUBLE_EQ(profile_.fraction_within(A, 0.5), 0.0);
  EXPECT_DOUBLE_EQ(profile_.fraction_within(A, 1.0), 2.0 / 3.0);
  EXPECT_DOUBLE_EQ(profile_.fraction_within(A, 3.0), 1.0);
  EXPECT_DOUBLE_EQ(profile_.fraction_within(B, 1.0), 1.0 / 3.0);
  EXPECT_DOUBLE_EQ(profile_.fraction_within(B, 1000.0), 2.0 / 3.0);
}

TEST_F(PerformanceProfileTest, FractionWithinIsMonotonic) {
  for (const auto& combo : profile_.combos()) {
    double previous = 0.0;
    for (double tau = 1.0; tau <= 8.0; tau += 0.25) {
      double fraction = profile_.fraction_within(combo, tau);
      EXPECT_GE(fraction, previous);
      EXPECT_LE(fraction, 1.0);
      previous = fraction;
    }
  }
}

TEST_F(PerformanceProfileTest, Curve) {
  auto points = profile_.curve(B);
  ASSERT_EQ(points.size(), 2);
  EXPECT_DOUBLE_EQ(points[0].tau, 1.0);
  EXPECT_DOUBLE_EQ(points[0].fraction, 1.0 / 3.0);
  EXPECT_DOUBLE_EQ(points[1].tau, 4.0);
  EXPECT_DOUBLE_EQ(points[1].fraction, 2.0 / 3.0);
}

TEST_F(PerformanceProfileTest, UnknownComboThrows) {
  KeyTuple unknown{"Z"};
  EXPECT_FALSE(profile_.has_combo(unknown));
  EXPECT_THROW((void)profile_.ratios(unknown), std::out_of_range);
  EXPECT_THROW((void)profile_.fraction_within(unknown, 2.0), std::out_of_range);
  EXPECT_THROW((void)profile_.curve(unknown), std::out_of_range);
}

TEST(PerformanceProfileEmptyTest, DefaultConstructed) {
  PerformanceProfile profile;
  EXPECT_TRUE(profile.combos().empty());
  EXPECT_EQ(profile.total_instances(), 0);
  EXPECT_EQ(profile.n_comparable_runs(), 0);
}

// =============================================================================
// Serialization
// =============================================================================

TEST_F(PerformanceProfileTest, JsonRoundTrip) {
  auto restored = PerformanceProfile::from_json_string(profile_.to_json_string());
  EXPECT_EQ(restored, profile_);
}

TEST_F(PerformanceProfileTest, JsonCarriesCurves) {
  auto j = nlohmann::json::parse(profile_.to_json_string());

  EXPECT_EQ(j["bench_id"], "bench_test");
  EXPECT_EQ(j["criterion"], "Time");
  EXPECT_EQ(j["total_instances"], 3);
  ASSERT_EQ(j["combos"].size(), 2);
  EXPECT_EQ(j["combos"][0]["label"], "(A)");
  EXPECT_EQ(j["combos"][1]["curve"].size(), 2);
  EXPECT_EQ(j["unsuccessful_instances"], nlohmann::json::parse(R"([["p4"]])"));
}

TEST_F(PerformanceProfileTest, MsgpackRoundTrip) {
  auto restored = PerformanceProfile::from_msgpack_string(profile_.to_msgpack_string());
  EXPECT_EQ(restored, profile_);
}

TEST_F(PerformanceProfileTest, WritesFiles) {
  auto dir = std::filesystem::temp_directory_path();
  auto json_path = (dir / "perfprof_profile_test.json").string();
  auto msgpack_path = (dir / "perfprof_profile_test.msgpack").string();

  profile_.to_json(json_path);
  profile_.to_msgpack(msgpack_path);

  std::ifstream json_file(json_path);
  std::stringstream json_buffer;
  json_buffer << json_file.rdbuf();
  EXPECT_EQ(PerformanceProfile::from_json_string(json_buffer.str()), profile_);

  std::ifstream msgpack_file(msgpack_path, std::ios::binary);
  std::stringstream msgpack_buffer;
  msgpack_buffer << msgpack_file.rdbuf();
  EXPECT_EQ(PerformanceProfile::from_msgpack_string(msgpack_buffer.str()), profile_);

  std::filesystem::remove(json_path);
  std::filesystem::remove(msgpack_path);
}

TEST_F(PerformanceProfileTest, WriteToMissingDirectoryThrows) {
  EXPECT_THROW(profile_.to_json("/nonexistent/dir/profile.json"), std::runtime_error);
  EXPECT_THROW(profile_.to_msgpack("/nonexistent/dir/profile.msgpack"), std::runtime_error);
}

TEST_F(PerformanceProfileTest, UnsortedRatiosRejected) {
  auto j = nlohmann::json::parse(profile_.to_json_string());
  j["combos"][0]["ratios"] = {3.0, 1.0, 1.0};
  EXPECT_THROW((void)PerformanceProfile::from_json_string(j.dump()), std::invalid_argument);
}

TEST_F(PerformanceProfileTest, InconsistentTotalRejected) {
  auto j = nlohmann::json::parse(profile_.to_json_string());
  j["total_instances"] = 7;
  EXPECT_THROW((void)PerformanceProfile::from_json_string(j.dump()), std::invalid_argument);
}

TEST(PerformanceProfileParseTest, RatioBelowOneRejected) {
  PerformanceProfile broken("bench", "Time", {"problem"}, {"solver"}, {{A, {0.5, 1.0}}},
                            {InstanceResult{.instance = {"p1"}, .best_value = 1.0, .winners = {A}}},
                            {}, 2);

  EXPECT_THROW((void)PerformanceProfile::from_json_string(broken.to_json_string()),
               std::invalid_argument);
  EXPECT_THROW((void)PerformanceProfile::from_msgpack_string(broken.to_msgpack_string()),
               std::invalid_argument);
}

TEST(PerformanceProfileParseTest, InstanceWithoutWinnerRejected) {
  PerformanceProfile broken("bench", "Time", {"problem"}, {"solver"}, {{A, {1.5}}},
                            {InstanceResult{.instance = {"p1"}, .best_value = 1.0, .winners = {}}},
                            {}, 1);

  EXPECT_THROW((void)PerformanceProfile::from_json_string(broken.to_json_string()),
               std::invalid_argument);
  EXPECT_THROW((void)PerformanceProfile::from_msgpack_string(broken.to_msgpack_string()),
               std::invalid_argument);
}

TEST(PerformanceProfileParseTest, UnknownWinnerRejected) {
  PerformanceProfile broken("bench", "Time", {"problem"}, {"solver"}, {{A, {1.0}}},
                            {InstanceResult{.instance = {"p1"}, .best_value = 1.0, .winners = {B}}},
                            {}, 1);

  EXPECT_THROW((void)PerformanceProfile::from_json_string(broken.to_json_string()),
               std::invalid_argument);
  EXPECT_THROW((void)PerformanceProfile::from_msgpack_string(broken.to_msgpack_string()),
               std::invalid_argument);
}

TEST(PerformanceProfileParseTest, InvalidJsonThrows) {
  EXPECT_THROW((void)PerformanceProfile::from_json_string("{not json"),
               nlohmann::json::parse_error);
  EXPECT_THROW((void)PerformanceProfile::from_json_string("{}"), nlohmann::json::exception);
}
