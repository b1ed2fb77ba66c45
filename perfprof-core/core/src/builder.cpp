#include <algorithm>
#include <cmath>
#include <map>
#include <optional>
#include <perfprof_core/builder.hpp>
#include <perfprof_core/log.hpp>
#include <perfprof_core/tracy.hpp>
#include <set>
#include <utility>

std::string_view to_string(NoData reason) noexcept {
  switch (reason) {
    case NoData::EmptyInput:
      return "no benchmark records";
    case NoData::NoAllowedCombos:
      return "no records for the requested combos";
    case NoData::NoIncludedRecords:
      return "no successful benchmark entry";
    case NoData::NoComparableValues:
      return "no valid metric values";
  }
  return "no data";
}

namespace {

// instance -> combo -> criterion values of the included runs
using Partitions = std::map<KeyTuple, std::map<KeyTuple, std::vector<double>>>;

ProfileResult no_data(NoData reason, std::string_view bench_id) {
  log_message(LogLevel::Warn, "No performance profile for '{}': {}", bench_id,
              to_string(reason));
  return std::unexpected(reason);
}

// Ratio of a combo that is not tied with the best, strictly above 1 so that
// wins() counts exactly the winners. nullopt when a zero makes it undefined.
std::optional<double> performance_ratio(double value, double best) {
  if (value == 0.0 || best == 0.0) {
    return std::nullopt;
  }
  double ratio = value > best ? value / best : best / value;
  return std::max(ratio, std::nextafter(1.0, 2.0));
}

}  // namespace

ProfileResult build_profile(std::span<const BenchmarkRecord> records, const ProfileConfig& config,
                            const std::optional<std::vector<KeyTuple>>& allowed_combos,
                            std::string_view bench_id) {
  PERFPROF_ZONE;
  if (records.empty()) {
    return no_data(NoData::EmptyInput, bench_id);
  }

  std::set<KeyTuple> allowed;
  if (allowed_combos) {
    allowed.insert(allowed_combos->begin(), allowed_combos->end());
  }
  const bool restrict_combos = !allowed.empty();

  std::set<KeyTuple> attempted;
  std::set<KeyTuple> combos;
  Partitions partitions;
  size_t n_well_formed = 0;
  size_t n_allowed = 0;
  size_t n_included = 0;

  for (const auto& record : records) {
    auto instance = project_keys(record, config.instance_keys());
    auto combo = project_keys(record, config.combo_keys());
    if (!instance || !combo) {
      continue;
    }
    ++n_well_formed;

    if (restrict_combos && !allowed.contains(*combo)) {
      continue;
    }
    ++n_allowed;
    attempted.insert(*instance);
    combos.insert(*combo);

    if (!config.includes(record)) {
      continue;
    }
    ++n_included;

    auto& values = partitions[*instance][*combo];
    if (MetricValue v = config.criterion().extract(record)) {
      values.push_back(*v);
    }
  }

  if (n_well_formed == 0) {
    return no_data(NoData::EmptyInput, bench_id);
  }
  if (n_allowed == 0) {
    return no_data(NoData::NoAllowedCombos, bench_id);
  }
  if (n_included == 0) {
    return no_data(NoData::NoIncludedRecords, bench_id);
  }
  PERFPROF_DEBUG_LOG("'{}': {} of {} records included", bench_id, n_included, records.size());

  // Censored combos keep an empty ratio sequence
  std::map<KeyTuple, std::vector<double>> ratios;
  for (const auto& combo : combos) {
    ratios[combo];
  }

  const auto& better = config.criterion().better;
  std::vector<InstanceResult> instances;
  std::vector<KeyTuple> unsuccessful;

  for (const auto& instance : attempted) {
    std::vector<std::pair<const KeyTuple*, double>> comparable;
    if (auto it = partitions.find(instance); it != partitions.end()) {
      for (const auto& [combo, values] : it->second) {
        if (values.empty()) {
          continue;
        }
        double v = config.aggregate(values);
        if (!std::isfinite(v) || v < 0.0) {
          continue;
        }
        comparable.emplace_back(&combo, v);
      }
    }

    // Nothing comparable: the instance says nothing about any combo
    if (comparable.empty()) {
      unsuccessful.push_back(instance);
      continue;
    }

    double best = comparable.front().second;
    for (size_t i = 1; i < comparable.size(); ++i) {
      if (better(comparable[i].second, best)) {
        best = comparable[i].second;
      }
    }

    InstanceResult result{.instance = instance, .best_value = best, .winners = {}};
    for (const auto& [combo, v] : comparable) {
      if (better(v, best)) {
        result.winners.push_back(*combo);
        ratios[*combo].push_back(1.0);
      } else if (auto ratio = performance_ratio(v, best)) {
        ratios[*combo].push_back(*ratio);
      }
    }
    instances.push_back(std::move(result));
  }

  if (instances.empty()) {
    return no_data(NoData::NoComparableValues, bench_id);
  }

  for (auto& [_, sequence] : ratios) {
    std::ranges::sort(sequence);
  }

  return PerformanceProfile(std::string(bench_id), config.criterion().name,
                            config.instance_keys(), config.combo_keys(), std::move(ratios),
                            std::move(instances), std::move(unsuccessful), n_included);
}
