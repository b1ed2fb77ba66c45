#pragma once
#include <functional>
#include <optional>
#include <string>

#include "record.hpp"

// Criterion value; std::nullopt marks missing data
using MetricValue = std::optional<double>;

enum class MetricSense { LowerIsBetter, HigherIsBetter };

// Scalar metric extracted from a record plus the ordering used to rank it.
// better(a, b) is true when a is at least as good as b.
struct ProfileCriterion {
  std::string name;  // e.g. "CPU time"
  std::function<MetricValue(const BenchmarkRecord&)> value;
  std::function<bool(double, double)> better;

  // value(record), with non-finite results reported as missing
  [[nodiscard]] MetricValue extract(const BenchmarkRecord& record) const;
};

// Criterion reading a numeric payload field through a JSON pointer ("/benchmark/time")
[[nodiscard]] ProfileCriterion make_field_criterion(std::string name, const std::string& field,
                                                    MetricSense sense);

[[nodiscard]] std::function<bool(double, double)> comparator_for(MetricSense sense);

[[nodiscard]] MetricSense metric_sense_from_string(const std::string& sense);
[[nodiscard]] std::string to_string(MetricSense sense);
