#pragma once
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "config.hpp"

class DuplicateNameError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

class NotFoundError : public std::out_of_range {
public:
  using std::out_of_range::out_of_range;
};

// Named store of profile configurations.
// Registration happens once at startup from a single thread; lookups may then
// run concurrently. Entries are never replaced or removed.
class ProfileRegistry {
public:
  ProfileRegistry() = default;
  ~ProfileRegistry() = default;

  // Movable
  ProfileRegistry(ProfileRegistry&&) = default;
  ProfileRegistry& operator=(ProfileRegistry&&) = default;
  ProfileRegistry(const ProfileRegistry&) = delete;
  ProfileRegistry& operator=(const ProfileRegistry&) = delete;

  // Throws DuplicateNameError if `name` is taken
  void register_config(const std::string& name, ProfileConfig config);

  // Throws NotFoundError if `name` is unknown
  [[nodiscard]] std::shared_ptr<const ProfileConfig> get(const std::string& name) const;

  [[nodiscard]] bool contains(const std::string& name) const;
  [[nodiscard]] std::vector<std::string> names() const;
  [[nodiscard]] size_t size() const noexcept { return configs_.size(); }

  // Process-wide instance
  [[nodiscard]] static ProfileRegistry& global();

private:
  std::map<std::string, std::shared_ptr<const ProfileConfig>> configs_;
};

// Default configurations ("default_cpu", "default_iter") as JSON data
[[nodiscard]] const std::string& default_profiles_json();

// Registers the default configurations that are not yet present.
// Returns the number added, so a second call is a no-op returning 0.
int register_default_profiles(ProfileRegistry& registry);

// Registers every entry of a {"name": spec, ...} JSON object.
// Throws DuplicateNameError on a taken name, before registering anything.
void register_profiles_json(ProfileRegistry& registry, const std::string& json_str);
void register_profiles_file(ProfileRegistry& registry, const std::string& path);
