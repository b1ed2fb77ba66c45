#include <benchmark/benchmark.h>

#include <cstdint>
#include <perfprof_core/analyzer.hpp>
#include <perfprof_core/builder.hpp>
#include <perfprof_core/registry.hpp>
#include <random>
#include <string>
#include <vector>

namespace {

// n_instances problems x n_combos solvers, ~5% failed runs
std::vector<BenchmarkRecord> generate_records(int n_instances, int n_combos, int n_reruns = 1,
                                              uint32_t seed = 42) {
  std::mt19937 rng(seed);
  std::lognormal_distribution<double> time_dist(0.0, 1.0);
  std::uniform_real_distribution<double> fail_dist(0.0, 1.0);

  std::vector<BenchmarkRecord> records;
  records.reserve(static_cast<size_t>(n_instances) * n_combos * n_reruns);
  for (int i = 0; i < n_instances; ++i) {
    for (int c = 0; c < n_combos; ++c) {
      for (int r = 0; r < n_reruns; ++r) {
        BenchmarkRecord record;
        record.keys = {{"problem", "problem_" + std::to_string(i / 4)},
                       {"grid_size", std::to_string(100 * (i % 4 + 1))},
                       {"model", c % 2 == 0 ? "exa" : "jump"},
                       {"solver", "solver_" + std::to_string(c)}};
        record.success = fail_dist(rng) > 0.05;
        record.payload = {{"benchmark", {{"time", time_dist(rng)}}},
                          {"iterations", 10 + static_cast<int>(rng() % 100)}};
        records.push_back(std::move(record));
      }
    }
  }
  return records;
}

const ProfileConfig& default_cpu() {
  static const ProfileConfig config = [] {
    ProfileRegistry registry;
    (void)register_default_profiles(registry);
    return *registry.get("default_cpu");
  }();
  return config;
}

}  // namespace

static void BM_BuildProfile(benchmark::State& state) {
  const int n_instances = state.range(0);
  const int n_combos = state.range(1);

  auto records = generate_records(n_instances, n_combos);
  const auto& config = default_cpu();

  for (auto _ : state) {
    auto profile = build_profile(records, config);
    benchmark::DoNotOptimize(profile);
  }

  state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(records.size()));
  state.SetLabel(std::to_string(n_instances) + "i/" + std::to_string(n_combos) + "c");
}

static void BM_BuildProfile_Reruns(benchmark::State& state) {
  const int n_reruns = state.range(0);

  auto records = generate_records(500, 8, n_reruns);
  const auto& config = default_cpu();

  for (auto _ : state) {
    auto profile = build_profile(records, config);
    benchmark::DoNotOptimize(profile);
  }

  state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(records.size()));
}

static void BM_AnalyzeProfile(benchmark::State& state) {
  const int n_instances = state.range(0);
  const int n_combos = state.range(1);

  auto records = generate_records(n_instances, n_combos);
  auto profile = build_profile(records, default_cpu());
  if (!profile) {
    state.SkipWithError("no profile for generated records");
    return;
  }

  for (auto _ : state) {
    auto text = analyze_profile(*profile);
    benchmark::DoNotOptimize(text);
  }
}

static void BM_ProfileFractionWithin(benchmark::State& state) {
  const int n_instances = state.range(0);

  auto records = generate_records(n_instances, 4);
  auto profile = build_profile(records, default_cpu());
  if (!profile) {
    state.SkipWithError("no profile for generated records");
    return;
  }
  const auto& combo = profile->combos().front();

  double tau = 1.0;
  for (auto _ : state) {
    double fraction = profile->fraction_within(combo, tau);
    benchmark::DoNotOptimize(fraction);
    tau = tau < 64.0 ? tau * 1.5 : 1.0;
  }
}

static void BM_ProfileMsgpackRoundTrip(benchmark::State& state) {
  auto records = generate_records(state.range(0), 8);
  auto profile = build_profile(records, default_cpu());
  if (!profile) {
    state.SkipWithError("no profile for generated records");
    return;
  }

  for (auto _ : state) {
    auto restored = PerformanceProfile::from_msgpack_string(profile->to_msgpack_string());
    benchmark::DoNotOptimize(restored);
  }
}

static void ProfileSizeArgs(benchmark::internal::Benchmark* b) {
  for (int instances : {10, 100, 1000, 10000}) {
    for (int combos : {2, 8, 32}) {
      b->Args({instances, combos});
    }
  }
  b->Unit(benchmark::kMicrosecond);
}

BENCHMARK(BM_BuildProfile)->Apply(ProfileSizeArgs);
BENCHMARK(BM_BuildProfile_Reruns)->Arg(1)->Arg(3)->Arg(10)->Unit(benchmark::kMicrosecond);
BENCHMARK(BM_AnalyzeProfile)->Apply(ProfileSizeArgs);
BENCHMARK(BM_ProfileFractionWithin)->Arg(100)->Arg(10000);
BENCHMARK(BM_ProfileMsgpackRoundTrip)->Arg(100)->Arg(1000)->Unit(benchmark::kMicrosecond);
