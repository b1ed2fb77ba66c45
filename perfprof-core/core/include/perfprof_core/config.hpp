#pragma once
#include <functional>
#include <nlohmann/json.hpp>
#include <span>
#include <string>
#include <vector>

#include "criterion.hpp"
#include "record.hpp"

// Combines repeated runs of one instance x combo (never called with an empty span)
using Aggregator = std::function<double(std::span<const double>)>;

using RecordPredicate = std::function<bool(const BenchmarkRecord&)>;

[[nodiscard]] double aggregate_mean(std::span<const double> xs);
[[nodiscard]] double aggregate_median(std::span<const double> xs);
[[nodiscard]] double aggregate_min(std::span<const double> xs);
[[nodiscard]] double aggregate_max(std::span<const double> xs);

// "mean", "median", "min" or "max"
[[nodiscard]] Aggregator aggregator_from_name(const std::string& name);

// Declarative description of a profile. Validated on construction, immutable afterwards.
class ProfileConfig {
public:
  ProfileConfig(std::vector<std::string> instance_keys, std::vector<std::string> combo_keys,
                ProfileCriterion criterion, RecordPredicate include, Aggregator aggregate);

  [[nodiscard]] const std::vector<std::string>& instance_keys() const noexcept {
    return instance_keys_;
  }
  [[nodiscard]] const std::vector<std::string>& combo_keys() const noexcept { return combo_keys_; }
  [[nodiscard]] const ProfileCriterion& criterion() const noexcept { return criterion_; }

  [[nodiscard]] bool includes(const BenchmarkRecord& record) const { return include_(record); }
  [[nodiscard]] double aggregate(std::span<const double> values) const {
    return aggregate_(values);
  }

private:
  std::vector<std::string> instance_keys_;
  std::vector<std::string> combo_keys_;
  ProfileCriterion criterion_;
  RecordPredicate include_;
  Aggregator aggregate_;
};

// Criterion part of a configuration stored as data
struct CriterionSpec {
  std::string name;
  std::string field;  // JSON pointer into BenchmarkRecord::payload
  MetricSense sense = MetricSense::LowerIsBetter;
};

// Configuration as data (JSON), materialised into a ProfileConfig on demand
struct ProfileConfigSpec {
  std::vector<std::string> instance_keys;
  std::vector<std::string> combo_keys;
  CriterionSpec criterion;
  bool require_success = true;
  std::string aggregate = "mean";

  [[nodiscard]] static ProfileConfigSpec from_json_string(const std::string& json_str);
  [[nodiscard]] std::string to_json_string() const;

  // Inclusion predicate: success (when required) and a present criterion value
  [[nodiscard]] ProfileConfig to_config() const;
};

void to_json(nlohmann::json& j, const CriterionSpec& c);
void from_json(const nlohmann::json& j, CriterionSpec& c);
void to_json(nlohmann::json& j, const ProfileConfigSpec& s);
void from_json(const nlohmann::json& j, ProfileConfigSpec& s);
