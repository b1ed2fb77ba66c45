#include <format>
#include <fstream>
#include <nlohmann/json.hpp>
#include <perfprof_core/registry.hpp>
#include <perfprof_core/tracy.hpp>
#include <sstream>
#include <utility>

using json = nlohmann::json;

// ============================================================================
// ProfileRegistry
// ============================================================================

void ProfileRegistry::register_config(const std::string& name, ProfileConfig config) {
  if (configs_.contains(name)) {
    throw DuplicateNameError(std::format("Profile '{}' is already registered", name));
  }
  configs_.emplace(name, std::make_shared<const ProfileConfig>(std::move(config)));
}

std::shared_ptr<const ProfileConfig> ProfileRegistry::get(const std::string& name) const {
  auto it = configs_.find(name);
  if (it == configs_.end()) {
    throw NotFoundError(std::format("Profile '{}' not found in registry", name));
  }
  return it->second;
}

bool ProfileRegistry::contains(const std::string& name) const { return configs_.contains(name); }

std::vector<std::string> ProfileRegistry::names() const {
  std::vector<std::string> result;
  result.reserve(configs_.size());
  for (const auto& [name, _] : configs_) {
    result.push_back(name);
  }
  return result;
}

ProfileRegistry& ProfileRegistry::global() {
  static ProfileRegistry registry;
  return registry;
}

// ============================================================================
// Bootstrap
// ============================================================================

const std::string& default_profiles_json() {
  static const std::string defaults = R"({
  "default_cpu": {
    "instance_keys": ["problem", "grid_size"],
    "combo_keys": ["model", "solver"],
    "criterion": {"name": "CPU time", "field": "/benchmark/time", "sense": "lower"},
    "require_success": true,
    "aggregate": "mean"
  },
  "default_iter": {
    "instance_keys": ["problem", "grid_size"],
    "combo_keys": ["model", "solver"],
    "criterion": {"name": "Iterations", "field": "/iterations", "sense": "lower"},
    "require_success": true,
    "aggregate": "mean"
  }
})";
  return defaults;
}

int register_default_profiles(ProfileRegistry& registry) {
  PERFPROF_ZONE;
  json j = json::parse(default_profiles_json());

  int added = 0;
  for (const auto& [name, spec] : j.items()) {
    if (registry.contains(name)) {
      continue;
    }
    registry.register_config(name, spec.get<ProfileConfigSpec>().to_config());
    ++added;
  }
  return added;
}

void register_profiles_json(ProfileRegistry& registry, const std::string& json_str) {
  PERFPROF_ZONE;
  json j = json::parse(json_str);
  if (!j.is_object()) {
    throw std::invalid_argument("profile definitions must be a JSON object keyed by name");
  }

  // Materialise everything first so a bad entry leaves the registry untouched
  std::vector<std::pair<std::string, ProfileConfig>> pending;
  pending.reserve(j.size());
  for (const auto& [name, spec] : j.items()) {
    if (registry.contains(name)) {
      throw DuplicateNameError(std::format("Profile '{}' is already registered", name));
    }
    pending.emplace_back(name, spec.get<ProfileConfigSpec>().to_config());
  }

  for (auto& [name, config] : pending) {
    registry.register_config(name, std::move(config));
  }
}

void register_profiles_file(ProfileRegistry& registry, const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error(std::format("Failed to open profile definitions file: {}", path));
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  register_profiles_json(registry, buffer.str());
}
