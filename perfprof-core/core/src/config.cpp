#include <algorithm>
#include <format>
#include <nlohmann/json.hpp>
#include <numeric>
#include <perfprof_core/config.hpp>
#include <stdexcept>
#include <unordered_set>

using json = nlohmann::json;

// ============================================================================
// Aggregators
// ============================================================================

double aggregate_mean(std::span<const double> xs) {
  return std::accumulate(xs.begin(), xs.end(), 0.0) / static_cast<double>(xs.size());
}

double aggregate_median(std::span<const double> xs) {
  std::vector<double> sorted(xs.begin(), xs.end());
  std::ranges::sort(sorted);
  size_t mid = sorted.size() / 2;
  if (sorted.size() % 2 == 0) {
    return 0.5 * (sorted[mid - 1] + sorted[mid]);
  }
  return sorted[mid];
}

double aggregate_min(std::span<const double> xs) { return std::ranges::min(xs); }

double aggregate_max(std::span<const double> xs) { return std::ranges::max(xs); }

Aggregator aggregator_from_name(const std::string& name) {
  if (name == "mean") return aggregate_mean;
  if (name == "median") return aggregate_median;
  if (name == "min") return aggregate_min;
  if (name == "max") return aggregate_max;
  throw std::invalid_argument(
      std::format("aggregate must be one of 'mean', 'median', 'min', 'max', got '{}'", name));
}

// ============================================================================
// ProfileConfig
// ============================================================================

namespace {

void validate_keys(const std::vector<std::string>& keys, const char* what) {
  if (keys.empty()) {
    throw std::invalid_argument(std::format("{} cannot be empty", what));
  }
  std::unordered_set<std::string> seen;
  for (const auto& key : keys) {
    if (key.empty()) {
      throw std::invalid_argument(std::format("{} cannot contain an empty key", what));
    }
    if (!seen.insert(key).second) {
      throw std::invalid_argument(std::format("{} lists '{}' more than once", what, key));
    }
  }
}

}  // namespace

ProfileConfig::ProfileConfig(std::vector<std::string> instance_keys,
                             std::vector<std::string> combo_keys, ProfileCriterion criterion,
                             RecordPredicate include, Aggregator aggregate)
    : instance_keys_(std::move(instance_keys)),
      combo_keys_(std::move(combo_keys)),
      criterion_(std::move(criterion)),
      include_(std::move(include)),
      aggregate_(std::move(aggregate)) {
  validate_keys(instance_keys_, "instance_keys");
  validate_keys(combo_keys_, "combo_keys");

  for (const auto& key : combo_keys_) {
    if (std::ranges::find(instance_keys_, key) != instance_keys_.end()) {
      throw std::invalid_argument(
          std::format("'{}' cannot be both an instance key and a combo key", key));
    }
  }

  if (!criterion_.value || !criterion_.better) {
    throw std::invalid_argument(
        std::format("criterion '{}' needs both a value and a better function", criterion_.name));
  }
  if (!include_) {
    throw std::invalid_argument("inclusion predicate cannot be empty");
  }
  if (!aggregate_) {
    throw std::invalid_argument("aggregator cannot be empty");
  }
}

// ============================================================================
// JSON Serialization - CriterionSpec / ProfileConfigSpec
// ============================================================================

void to_json(json& j, const CriterionSpec& c) {
  j = {{"name", c.name}, {"field", c.field}, {"sense", to_string(c.sense)}};
}

void from_json(const json& j, CriterionSpec& c) {
  j.at("name").get_to(c.name);
  j.at("field").get_to(c.field);
  c.sense = metric_sense_from_string(j.value("sense", "lower"));
}

void to_json(json& j, const ProfileConfigSpec& s) {
  j = {{"instance_keys", s.instance_keys},
       {"combo_keys", s.combo_keys},
       {"criterion", s.criterion},
       {"require_success", s.require_success},
       {"aggregate", s.aggregate}};
}

void from_json(const json& j, ProfileConfigSpec& s) {
  j.at("instance_keys").get_to(s.instance_keys);
  j.at("combo_keys").get_to(s.combo_keys);
  j.at("criterion").get_to(s.criterion);
  s.require_success = j.value("require_success", true);
  s.aggregate = j.value("aggregate", "mean");
}

ProfileConfigSpec ProfileConfigSpec::from_json_string(const std::string& json_str) {
  return json::parse(json_str).get<ProfileConfigSpec>();
}

std::string ProfileConfigSpec::to_json_string() const {
  json j = *this;
  return j.dump(2);
}

ProfileConfig ProfileConfigSpec::to_config() const {
  ProfileCriterion field_criterion
      = make_field_criterion(criterion.name, criterion.field, criterion.sense);

  RecordPredicate include = [field_criterion, require_success = require_success](
                                const BenchmarkRecord& record) {
    if (require_success && !record.success) {
      return false;
    }
    return field_criterion.extract(record).has_value();
  };

  return ProfileConfig(instance_keys, combo_keys, std::move(field_criterion), std::move(include),
                       aggregator_from_name(aggregate));
}
