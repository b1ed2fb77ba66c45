#include <algorithm>
#include <format>
#include <fstream>
#include <msgpack.hpp>
#include <nlohmann/json.hpp>
#include <perfprof_core/profile.hpp>
#include <perfprof_core/tracy.hpp>
#include <stdexcept>

using json = nlohmann::json;

PerformanceProfile::PerformanceProfile(std::string bench_id, std::string criterion_name,
                                       std::vector<std::string> instance_keys,
                                       std::vector<std::string> combo_keys,
                                       std::map<KeyTuple, std::vector<double>> ratios,
                                       std::vector<InstanceResult> instances,
                                       std::vector<KeyTuple> unsuccessful_instances,
                                       size_t n_included_records)
    : bench_id_(std::move(bench_id)),
      criterion_name_(std::move(criterion_name)),
      instance_keys_(std::move(instance_keys)),
      combo_keys_(std::move(combo_keys)),
      ratios_(std::move(ratios)),
      instances_(std::move(instances)),
      unsuccessful_instances_(std::move(unsuccessful_instances)),
      n_included_records_(n_included_records) {
  combos_.reserve(ratios_.size());
  bool any_ratio = false;
  for (const auto& [combo, sequence] : ratios_) {
    combos_.push_back(combo);
    if (sequence.empty()) continue;
    if (!any_ratio) {
      min_ratio_ = sequence.front();
      max_ratio_ = sequence.back();
      any_ratio = true;
    } else {
      min_ratio_ = std::min(min_ratio_, sequence.front());
      max_ratio_ = std::max(max_ratio_, sequence.back());
    }
  }
}

// ============================================================================
// Queries
// ============================================================================

const std::vector<double>& PerformanceProfile::ratios(const KeyTuple& combo) const {
  auto it = ratios_.find(combo);
  if (it == ratios_.end()) {
    throw std::out_of_range(
        std::format("Combo {} is not part of the performance profile", format_key(combo)));
  }
  return it->second;
}

size_t PerformanceProfile::n_comparable_runs() const noexcept {
  size_t n = 0;
  for (const auto& [_, sequence] : ratios_) {
    n += sequence.size();
  }
  return n;
}

double PerformanceProfile::fraction_within(const KeyTuple& combo, double tau) const {
  const auto& sequence = ratios(combo);
  if (instances_.empty()) {
    return 0.0;
  }
  auto n_within = std::ranges::upper_bound(sequence, tau) - sequence.begin();
  return static_cast<double>(n_within) / static_cast<double>(instances_.size());
}

std::vector<CurvePoint> PerformanceProfile::curve(const KeyTuple& combo) const {
  const auto& sequence = ratios(combo);
  std::vector<CurvePoint> points;
  points.reserve(sequence.size());
  for (double tau : sequence) {
    points.push_back(CurvePoint{.tau = tau, .fraction = fraction_within(combo, tau)});
  }
  return points;
}

size_t PerformanceProfile::wins(const KeyTuple& combo) const {
  const auto& sequence = ratios(combo);
  return static_cast<size_t>(std::ranges::count(sequence, 1.0));
}

// ============================================================================
// Loading
// ============================================================================

namespace {

void validate_ratios(const std::vector<double>& sequence) {
  if (!std::ranges::is_sorted(sequence)) {
    throw std::invalid_argument("combo ratios must be sorted ascending");
  }
  if (!sequence.empty() && !(sequence.front() >= 1.0)) {
    throw std::invalid_argument(
        std::format("combo ratios must be at least 1, got {}", sequence.front()));
  }
}

// Every instance is won by at least one combo of the profile
void validate_winners(const PerformanceProfile& profile) {
  for (const auto& r : profile.instances()) {
    if (r.winners.empty()) {
      throw std::invalid_argument(
          std::format("instance {} has no winning combo", format_key(r.instance)));
    }
    for (const auto& combo : r.winners) {
      if (!profile.has_combo(combo)) {
        throw std::invalid_argument(std::format("instance {} is won by unknown combo {}",
                                                format_key(r.instance), format_key(combo)));
      }
    }
  }
}

}  // namespace

// ============================================================================
// JSON Serialization
// ============================================================================

void to_json(json& j, const InstanceResult& r) {
  j = {{"instance", r.instance}, {"best_value", r.best_value}, {"winners", r.winners}};
}

void from_json(const json& j, InstanceResult& r) {
  j.at("instance").get_to(r.instance);
  j.at("best_value").get_to(r.best_value);
  j.at("winners").get_to(r.winners);
}

std::string PerformanceProfile::to_json_string() const {
  json j;

  j["bench_id"] = bench_id_;
  j["criterion"] = criterion_name_;
  j["instance_keys"] = instance_keys_;
  j["combo_keys"] = combo_keys_;
  j["total_instances"] = instances_.size();
  j["n_included_records"] = n_included_records_;

  // Ratios plus the derived curve points consumed by renderers
  json combos_array = json::array();
  for (const auto& combo : combos_) {
    json points = json::array();
    for (const auto& p : curve(combo)) {
      points.push_back({p.tau, p.fraction});
    }
    combos_array.push_back({{"combo", combo},
                            {"label", format_key(combo)},
                            {"ratios", ratios_.at(combo)},
                            {"curve", points}});
  }
  j["combos"] = combos_array;

  j["instances"] = instances_;
  j["unsuccessful_instances"] = unsuccessful_instances_;

  return j.dump(2);
}

PerformanceProfile PerformanceProfile::from_json_string(const std::string& json_str) {
  PERFPROF_ZONE;
  json j = json::parse(json_str);

  std::map<KeyTuple, std::vector<double>> ratios;
  for (const auto& entry : j.at("combos")) {
    auto sequence = entry.at("ratios").get<std::vector<double>>();
    validate_ratios(sequence);
    ratios.emplace(entry.at("combo").get<KeyTuple>(), std::move(sequence));
  }

  auto profile = PerformanceProfile(
      j.value("bench_id", ""), j.at("criterion").get<std::string>(),
      j.at("instance_keys").get<std::vector<std::string>>(),
      j.at("combo_keys").get<std::vector<std::string>>(), std::move(ratios),
      j.at("instances").get<std::vector<InstanceResult>>(),
      j.value("unsuccessful_instances", std::vector<KeyTuple>{}),
      j.value("n_included_records", size_t{0}));

  if (j.contains("total_instances")
      && j.at("total_instances").get<size_t>() != profile.total_instances()) {
    throw std::invalid_argument(
        std::format("total_instances ({}) does not match the instance list ({})",
                    j.at("total_instances").get<size_t>(), profile.total_instances()));
  }
  validate_winners(profile);
  return profile;
}

void PerformanceProfile::to_json(const std::string& path) const {
  std::ofstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error(std::format("Failed to open profile file for writing: {}", path));
  }
  file << to_json_string();
}

// ============================================================================
// MessagePack Serialization
// ============================================================================

std::string PerformanceProfile::to_msgpack_string() const {
  msgpack::sbuffer buffer;
  msgpack::packer<msgpack::sbuffer> pk(&buffer);

  pk.pack_map(8);

  pk.pack("bench_id");
  pk.pack(bench_id_);
  pk.pack("criterion");
  pk.pack(criterion_name_);
  pk.pack("instance_keys");
  pk.pack(instance_keys_);
  pk.pack("combo_keys");
  pk.pack(combo_keys_);
  pk.pack("n_included_records");
  pk.pack(static_cast<uint64_t>(n_included_records_));

  pk.pack("combos");
  pk.pack_array(static_cast<uint32_t>(combos_.size()));
  for (const auto& combo : combos_) {
    pk.pack_map(2);
    pk.pack("combo");
    pk.pack(combo);
    pk.pack("ratios");
    pk.pack(ratios_.at(combo));
  }

  pk.pack("instances");
  pk.pack_array(static_cast<uint32_t>(instances_.size()));
  for (const auto& r : instances_) {
    pk.pack_map(3);
    pk.pack("instance");
    pk.pack(r.instance);
    pk.pack("best_value");
    pk.pack(r.best_value);
    pk.pack("winners");
    pk.pack(r.winners);
  }

  pk.pack("unsuccessful_instances");
  pk.pack(unsuccessful_instances_);

  return std::string(buffer.data(), buffer.size());
}

PerformanceProfile PerformanceProfile::from_msgpack_string(const std::string& data) {
  PERFPROF_ZONE;

  msgpack::object_handle handle = msgpack::unpack(data.data(), data.size());
  auto map = handle.get().as<std::map<std::string, msgpack::object>>();

  std::map<KeyTuple, std::vector<double>> ratios;
  auto combos_arr = map.at("combos").as<std::vector<msgpack::object>>();
  for (const auto& combo_obj : combos_arr) {
    auto combo_map = combo_obj.as<std::map<std::string, msgpack::object>>();
    auto sequence = combo_map.at("ratios").as<std::vector<double>>();
    validate_ratios(sequence);
    ratios.emplace(combo_map.at("combo").as<KeyTuple>(), std::move(sequence));
  }

  std::vector<InstanceResult> instances;
  auto instances_arr = map.at("instances").as<std::vector<msgpack::object>>();
  instances.reserve(instances_arr.size());
  for (const auto& instance_obj : instances_arr) {
    auto instance_map = instance_obj.as<std::map<std::string, msgpack::object>>();
    InstanceResult r;
    r.instance = instance_map.at("instance").as<KeyTuple>();
    r.best_value = instance_map.at("best_value").as<double>();
    r.winners = instance_map.at("winners").as<std::vector<KeyTuple>>();
    instances.push_back(std::move(r));
  }

  std::vector<KeyTuple> unsuccessful;
  if (map.contains("unsuccessful_instances")) {
    unsuccessful = map.at("unsuccessful_instances").as<std::vector<KeyTuple>>();
  }

  size_t n_included = map.contains("n_included_records")
                          ? static_cast<size_t>(map.at("n_included_records").as<uint64_t>())
                          : 0;

  auto profile = PerformanceProfile(
      map.contains("bench_id") ? map.at("bench_id").as<std::string>() : "",
      map.at("criterion").as<std::string>(),
      map.at("instance_keys").as<std::vector<std::string>>(),
      map.at("combo_keys").as<std::vector<std::string>>(), std::move(ratios),
      std::move(instances), std::move(unsuccessful), n_included);
  validate_winners(profile);
  return profile;
}

void PerformanceProfile::to_msgpack(const std::string& path) const {
  std::string binary_data = to_msgpack_string();
  std::ofstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw std::runtime_error(std::format("Failed to open msgpack file for writing: {}", path));
  }
  file.write(binary_data.data(), static_cast<std::streamsize>(binary_data.size()));
}
