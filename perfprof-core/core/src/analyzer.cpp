#include <algorithm>
#include <cmath>
#include <format>
#include <iterator>
#include <perfprof_core/analyzer.hpp>
#include <perfprof_core/tracy.hpp>
#include <ranges>
#include <set>

namespace {

double percent(size_t count, size_t total) {
  if (total == 0) return 0.0;
  double p = 100.0 * static_cast<double>(count) / static_cast<double>(total);
  return std::round(p * 10.0) / 10.0;
}

std::optional<double> geometric_mean(const std::vector<double>& ratios) {
  if (ratios.empty()) return std::nullopt;
  double log_sum = 0.0;
  for (double r : ratios) {
    log_sum += std::log(r);
  }
  return std::exp(log_sum / static_cast<double>(ratios.size()));
}

std::string join(const std::vector<std::string>& parts, std::string_view sep) {
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) out += sep;
    out += parts[i];
  }
  return out;
}

// Combos maximising `score`, ties kept in profile order
template <typename Score>
std::vector<KeyTuple> best_combos(const std::vector<ComboPerformance>& performances,
                                  Score score) {
  std::vector<KeyTuple> combos;
  if (performances.empty()) return combos;

  auto best = std::ranges::max(performances | std::views::transform(score));
  for (const auto& p : performances) {
    if (score(p) == best) combos.push_back(p.combo);
  }
  return combos;
}

const ComboPerformance& find_performance(const ProfileAnalysis& analysis,
                                         const KeyTuple& combo) {
  return *std::ranges::find(analysis.performances, combo, &ComboPerformance::combo);
}

}  // namespace

ProfileAnalysis compute_profile_stats(const PerformanceProfile& profile,
                                      double robustness_bound) {
  PERFPROF_ZONE;
  ProfileAnalysis analysis;
  analysis.bench_id = profile.bench_id();
  analysis.robustness_bound = robustness_bound;

  ProfileStats& stats = analysis.stats;
  std::set<std::string> problems;
  for (const auto& r : profile.instances()) {
    if (!r.instance.empty()) problems.insert(r.instance.front());
  }
  for (const auto& instance : profile.unsuccessful_instances()) {
    if (!instance.empty()) problems.insert(instance.front());
  }
  stats.n_problems = problems.size();
  stats.n_instances = profile.total_instances();
  stats.n_attempted_instances = profile.attempted_instances();
  stats.n_combos = profile.combos().size();
  stats.n_comparable_runs = profile.n_comparable_runs();
  stats.n_successful_instances = profile.total_instances();
  stats.unsuccessful_instances = profile.unsuccessful_instances();
  stats.instance_keys = profile.instance_keys();
  stats.combo_keys = profile.combo_keys();
  stats.criterion_name = profile.criterion_name();

  const size_t n = profile.total_instances();
  for (const auto& combo : profile.combos()) {
    const auto& ratios = profile.ratios(combo);

    ComboPerformance perf;
    perf.combo = combo;
    perf.label = format_key(combo);
    perf.wins = profile.wins(combo);
    perf.solved = ratios.size();
    perf.within_bound = static_cast<size_t>(std::ranges::upper_bound(ratios, robustness_bound)
                                            - ratios.begin());
    perf.efficiency = percent(perf.wins, n);
    perf.solved_rate = percent(perf.solved, n);
    perf.robustness = percent(perf.within_bound, n);
    perf.geometric_mean_ratio = geometric_mean(ratios);
    analysis.performances.push_back(std::move(perf));
  }

  // Raw counts share one denominator, so ranking them ranks the percentages
  analysis.most_robust = best_combos(analysis.performances,
                                     [](const ComboPerformance& p) { return p.within_bound; });
  analysis.most_efficient
      = best_combos(analysis.performances, [](const ComboPerformance& p) { return p.wins; });

  return analysis;
}

std::string format_analysis_markdown(const ProfileAnalysis& analysis) {
  const ProfileStats& stats = analysis.stats;
  std::string out;
  auto buf = std::back_inserter(out);

  // Header
  std::format_to(buf, "!!! info \"Performance Profile Analysis\"\n");
  std::format_to(buf, "    **Dataset overview for `{}`:**\n", analysis.bench_id);
  std::format_to(buf, "    - **Problems**: {} unique problems\n", stats.n_problems);
  std::format_to(buf, "    - **Instances**: {}\n", stats.n_attempted_instances);
  std::format_to(buf, "    - **Solver combos**: {}\n", stats.n_combos);

  // Configuration
  out += "\n";
  std::format_to(buf, "    **Profile configuration:**\n");
  std::format_to(buf, "    - **Instance definition**: ({})\n", join(stats.instance_keys, ", "));
  std::format_to(buf, "    - **Solver combos definition**: ({})\n", join(stats.combo_keys, ", "));
  std::format_to(buf, "    - **Criterion**: {}\n", stats.criterion_name);

  // Success statistics
  size_t total_runs = stats.n_attempted_instances * stats.n_combos;
  std::format_to(buf, "    - **Successful runs**: {}/{} ({:.1f}%)\n", stats.n_comparable_runs,
                 total_runs, percent(stats.n_comparable_runs, total_runs));
  std::format_to(buf, "    - **Successful instances**: {}/{} ({:.1f}%)\n",
                 stats.n_successful_instances, stats.n_attempted_instances,
                 percent(stats.n_successful_instances, stats.n_attempted_instances));

  if (stats.unsuccessful_instances.empty()) {
    out += "    - **Unsuccessful instances**: none (every instance had at least one successful "
           "run)\n";
  } else {
    out += "    - **Unsuccessful instances** (no solver converged):\n";
    for (const auto& instance : stats.unsuccessful_instances) {
      std::format_to(buf, "      - `{}`\n", join(instance, ", "));
    }
  }
  out += "\n";

  std::format_to(buf, "    **Efficiency (% of instances where best):**\n");
  for (const auto& p : analysis.performances) {
    std::format_to(buf, "    - `{}`: {:.1f}% ({} of {})\n", p.label, p.efficiency, p.wins,
                   stats.n_instances);
  }

  std::format_to(buf, "    **Solved (% of instances with a comparable value):**\n");
  for (const auto& p : analysis.performances) {
    std::format_to(buf, "    - `{}`: {:.1f}%\n", p.label, p.solved_rate);
  }

  std::format_to(buf, "    **Robustness (% of instances within {:g}x of the best):**\n",
                 analysis.robustness_bound);
  for (const auto& p : analysis.performances) {
    std::format_to(buf, "    - `{}`: {:.1f}%\n", p.label, p.robustness);
  }

  std::format_to(buf, "    **Geometric-mean ratio (solved instances):**\n");
  for (const auto& p : analysis.performances) {
    if (p.geometric_mean_ratio) {
      std::format_to(buf, "    - `{}`: {:.2f}x ({:.1f}% overhead)\n", p.label,
                     *p.geometric_mean_ratio, 100.0 * (*p.geometric_mean_ratio - 1.0));
    } else {
      std::format_to(buf, "    - `{}`: n/a\n", p.label);
    }
  }

  // Best performers
  if (analysis.most_robust.size() == 1) {
    const auto& best = find_performance(analysis, analysis.most_robust.front());
    std::format_to(buf, "    **Most robust**: `{}` is within {:g}x of the best on {:.1f}% of "
                   "instances.\n",
                   best.label, analysis.robustness_bound, best.robustness);
  } else if (!analysis.most_robust.empty()) {
    const auto& best = find_performance(analysis, analysis.most_robust.front());
    std::format_to(buf, "    **Most robust**: {} combinations tied at {:.1f}%.\n",
                   analysis.most_robust.size(), best.robustness);
  }
  out += "\n";

  if (analysis.most_efficient.size() == 1) {
    const auto& best = find_performance(analysis, analysis.most_efficient.front());
    std::format_to(buf, "    **Most efficient**: `{}` was best on {:.1f}% of instances.\n",
                   best.label, best.efficiency);
  } else if (!analysis.most_efficient.empty()) {
    const auto& best = find_performance(analysis, analysis.most_efficient.front());
    std::format_to(buf, "    **Most efficient**: {} combinations tied at {:.1f}%.\n",
                   analysis.most_efficient.size(), best.efficiency);
  }
  out += "\n";

  return out;
}

std::string analyze_profile(const PerformanceProfile& profile) {
  return format_analysis_markdown(compute_profile_stats(profile));
}

std::string no_data_message(std::string_view bench_id, NoData reason) {
  if (reason == NoData::EmptyInput) {
    return std::format("!!! warning\n    No benchmark data available for analysis for `{}`.\n",
                       bench_id);
  }
  return std::format("!!! warning\n    No successful runs found to analyze for `{}` ({}).\n",
                     bench_id, to_string(reason));
}
