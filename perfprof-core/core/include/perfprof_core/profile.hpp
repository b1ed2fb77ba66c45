#pragma once
#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "record.hpp"

// Best value reached on one instance and the combos that reached it
struct InstanceResult {
  KeyTuple instance;
  double best_value = 0.0;
  std::vector<KeyTuple> winners;

  bool operator==(const InstanceResult&) const = default;
};

// One step of a performance profile curve: rho(tau)
struct CurvePoint {
  double tau = 0.0;
  double fraction = 0.0;

  bool operator==(const CurvePoint&) const = default;
};

// Computed Dolan-More performance profile.
// ratios(c) is sorted ascending and holds one ratio >= 1 per instance on which
// combo c produced a comparable value; censored instances contribute nothing
// but still count in total_instances().
class PerformanceProfile {
public:
  PerformanceProfile() = default;
  PerformanceProfile(std::string bench_id, std::string criterion_name,
                     std::vector<std::string> instance_keys, std::vector<std::string> combo_keys,
                     std::map<KeyTuple, std::vector<double>> ratios,
                     std::vector<InstanceResult> instances,
                     std::vector<KeyTuple> unsuccessful_instances, size_t n_included_records);

  [[nodiscard]] const std::string& bench_id() const noexcept { return bench_id_; }
  [[nodiscard]] const std::string& criterion_name() const noexcept { return criterion_name_; }
  [[nodiscard]] const std::vector<std::string>& instance_keys() const noexcept {
    return instance_keys_;
  }
  [[nodiscard]] const std::vector<std::string>& combo_keys() const noexcept { return combo_keys_; }

  [[nodiscard]] const std::vector<KeyTuple>& combos() const noexcept { return combos_; }
  [[nodiscard]] bool has_combo(const KeyTuple& combo) const { return ratios_.contains(combo); }

  // Throws std::out_of_range for a combo that is not part of the profile
  [[nodiscard]] const std::vector<double>& ratios(const KeyTuple& combo) const;

  [[nodiscard]] const std::vector<InstanceResult>& instances() const noexcept {
    return instances_;
  }
  // Instances attempted but without any comparable value
  [[nodiscard]] const std::vector<KeyTuple>& unsuccessful_instances() const noexcept {
    return unsuccessful_instances_;
  }

  [[nodiscard]] size_t total_instances() const noexcept { return instances_.size(); }
  [[nodiscard]] size_t attempted_instances() const noexcept {
    return instances_.size() + unsuccessful_instances_.size();
  }
  [[nodiscard]] size_t n_included_records() const noexcept { return n_included_records_; }
  [[nodiscard]] size_t n_comparable_runs() const noexcept;

  // count(ratios(combo) <= tau) / total_instances()
  [[nodiscard]] double fraction_within(const KeyTuple& combo, double tau) const;

  // Step points (r_i, rho(r_i)) over the sorted ratios of `combo`
  [[nodiscard]] std::vector<CurvePoint> curve(const KeyTuple& combo) const;

  // Instances where `combo` is tied for best
  [[nodiscard]] size_t wins(const KeyTuple& combo) const;
  // Instances where `combo` produced a comparable value
  [[nodiscard]] size_t solved(const KeyTuple& combo) const { return ratios(combo).size(); }

  [[nodiscard]] double min_ratio() const noexcept { return min_ratio_; }
  [[nodiscard]] double max_ratio() const noexcept { return max_ratio_; }

  [[nodiscard]] static PerformanceProfile from_json_string(const std::string& json_str);
  [[nodiscard]] static PerformanceProfile from_msgpack_string(const std::string& data);

  void to_json(const std::string& path) const;
  [[nodiscard]] std::string to_json_string() const;
  void to_msgpack(const std::string& path) const;
  [[nodiscard]] std::string to_msgpack_string() const;

  bool operator==(const PerformanceProfile&) const = default;

private:
  std::string bench_id_;
  std::string criterion_name_;
  std::vector<std::string> instance_keys_;
  std::vector<std::string> combo_keys_;
  std::vector<KeyTuple> combos_;
  std::map<KeyTuple, std::vector<double>> ratios_;
  std::vector<InstanceResult> instances_;
  std::vector<KeyTuple> unsuccessful_instances_;
  size_t n_included_records_ = 0;
  double min_ratio_ = 1.0;
  double max_ratio_ = 1.0;
};
