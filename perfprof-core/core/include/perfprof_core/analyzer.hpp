#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "builder.hpp"
#include "profile.hpp"

inline constexpr double DEFAULT_ROBUSTNESS_BOUND = 10.0;

struct ProfileStats {
  size_t n_problems = 0;  // distinct values of the first instance key
  size_t n_instances = 0;
  size_t n_attempted_instances = 0;
  size_t n_combos = 0;
  size_t n_comparable_runs = 0;
  size_t n_successful_instances = 0;
  std::vector<KeyTuple> unsuccessful_instances;
  std::vector<std::string> instance_keys;
  std::vector<std::string> combo_keys;
  std::string criterion_name;
};

// Percentages are in [0, 100], rounded to one decimal
struct ComboPerformance {
  KeyTuple combo;
  std::string label;
  size_t wins = 0;
  size_t solved = 0;
  size_t within_bound = 0;
  double efficiency = 0.0;  // % of instances won outright
  double solved_rate = 0.0; // % of instances with a comparable value
  double robustness = 0.0;  // % of instances with ratio <= robustness bound
  std::optional<double> geometric_mean_ratio;  // over solved instances
};

struct ProfileAnalysis {
  std::string bench_id;
  double robustness_bound = DEFAULT_ROBUSTNESS_BOUND;
  ProfileStats stats;
  std::vector<ComboPerformance> performances;
  std::vector<KeyTuple> most_robust;
  std::vector<KeyTuple> most_efficient;
};

// Reads only the profile, so the analysis always agrees with the curves
[[nodiscard]] ProfileAnalysis compute_profile_stats(
    const PerformanceProfile& profile, double robustness_bound = DEFAULT_ROBUSTNESS_BOUND);

[[nodiscard]] std::string format_analysis_markdown(const ProfileAnalysis& analysis);

[[nodiscard]] std::string analyze_profile(const PerformanceProfile& profile);

// Neutral placeholder rendered in place of an analysis
[[nodiscard]] std::string no_data_message(std::string_view bench_id, NoData reason);
