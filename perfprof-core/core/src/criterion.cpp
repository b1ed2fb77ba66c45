#include <cmath>
#include <format>
#include <nlohmann/json.hpp>
#include <perfprof_core/criterion.hpp>
#include <stdexcept>

using json = nlohmann::json;

MetricValue ProfileCriterion::extract(const BenchmarkRecord& record) const {
  MetricValue v = value(record);
  if (v && !std::isfinite(*v)) {
    return std::nullopt;
  }
  return v;
}

std::function<bool(double, double)> comparator_for(MetricSense sense) {
  if (sense == MetricSense::HigherIsBetter) {
    return [](double a, double b) { return a >= b; };
  }
  return [](double a, double b) { return a <= b; };
}

ProfileCriterion make_field_criterion(std::string name, const std::string& field,
                                      MetricSense sense) {
  json::json_pointer pointer;
  try {
    pointer = json::json_pointer(field);
  } catch (const json::parse_error& e) {
    throw std::invalid_argument(
        std::format("Invalid criterion field '{}' for '{}': {}", field, name, e.what()));
  }
  if (pointer.empty()) {
    throw std::invalid_argument(std::format("Criterion '{}' must name a payload field", name));
  }

  auto extract = [pointer](const BenchmarkRecord& record) -> MetricValue {
    if (!record.payload.contains(pointer)) {
      return std::nullopt;
    }
    const json& v = record.payload.at(pointer);
    if (!v.is_number()) {
      return std::nullopt;
    }
    return v.get<double>();
  };

  return ProfileCriterion{
      .name = std::move(name), .value = std::move(extract), .better = comparator_for(sense)};
}

MetricSense metric_sense_from_string(const std::string& sense) {
  if (sense == "lower") return MetricSense::LowerIsBetter;
  if (sense == "higher") return MetricSense::HigherIsBetter;
  throw std::invalid_argument(
      std::format("metric sense must be 'lower' or 'higher', got '{}'", sense));
}

std::string to_string(MetricSense sense) {
  return sense == MetricSense::HigherIsBetter ? "higher" : "lower";
}
