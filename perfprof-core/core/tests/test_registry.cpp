#include <gtest/gtest.h>

#include <perfprof_core/registry.hpp>

#include "test_utils.hpp"

// =============================================================================
// Registration and Lookup
// =============================================================================

TEST(ProfileRegistryTest, EmptyRegistry) {
  ProfileRegistry registry;
  EXPECT_EQ(registry.size(), 0);
  EXPECT_TRUE(registry.names().empty());
  EXPECT_FALSE(registry.contains("default_cpu"));
}

TEST(ProfileRegistryTest, RegisterAndGet) {
  ProfileRegistry registry;
  registry.register_config("time", test_utils::time_config());

  EXPECT_TRUE(registry.contains("time"));
  EXPECT_EQ(registry.size(), 1);
  auto config = registry.get("time");
  ASSERT_NE(config, nullptr);
  EXPECT_EQ(config->criterion().name, "Time");
}

TEST(ProfileRegistryTest, LookupReturnsSameEntry) {
  ProfileRegistry registry;
  registry.register_config("time", test_utils::time_config());

  EXPECT_EQ(registry.get("time").get(), registry.get("time").get());
}

TEST(ProfileRegistryTest, DuplicateRegistrationThrows) {
  ProfileRegistry registry;
  registry.register_config("time", test_utils::time_config());

  EXPECT_THROW(
      registry.register_config("time", test_utils::time_config(MetricSense::HigherIsBetter)),
      DuplicateNameError);

  // The first registration is kept
  auto better = registry.get("time")->criterion().better;
  EXPECT_TRUE(better(1.0, 2.0));
}

TEST(ProfileRegistryTest, UnknownNameThrows) {
  ProfileRegistry registry;
  EXPECT_THROW((void)registry.get("nonexistent"), NotFoundError);
  EXPECT_THROW((void)registry.get("nonexistent"), std::out_of_range);
}

TEST(ProfileRegistryTest, NamesAreSorted) {
  ProfileRegistry registry;
  registry.register_config("zeta", test_utils::time_config());
  registry.register_config("alpha", test_utils::time_config());

  EXPECT_EQ(registry.names(), (std::vector<std::string>{"alpha", "zeta"}));
}

TEST(ProfileRegistryTest, GlobalIsSingleInstance) {
  EXPECT_EQ(&ProfileRegistry::global(), &ProfileRegistry::global());
}

// =============================================================================
// Bootstrap
// =============================================================================

TEST(DefaultProfilesTest, RegistersCpuAndIterations) {
  ProfileRegistry registry;
  EXPECT_EQ(register_default_profiles(registry), 2);

  EXPECT_EQ(registry.names(), (std::vector<std::string>{"default_cpu", "default_iter"}));

  auto cpu = registry.get("default_cpu");
  EXPECT_EQ(cpu->criterion().name, "CPU time");
  EXPECT_EQ(cpu->instance_keys(), (std::vector<std::string>{"problem", "grid_size"}));
  EXPECT_EQ(cpu->combo_keys(), (std::vector<std::string>{"model", "solver"}));

  auto iter = registry.get("default_iter");
  EXPECT_EQ(iter->criterion().name, "Iterations");
}

TEST(DefaultProfilesTest, BootstrapIsIdempotent) {
  ProfileRegistry registry;
  EXPECT_EQ(register_default_profiles(registry), 2);
  auto cpu = registry.get("default_cpu");

  EXPECT_EQ(register_default_profiles(registry), 0);
  EXPECT_EQ(registry.size(), 2);
  EXPECT_EQ(registry.get("default_cpu").get(), cpu.get());
}

TEST(DefaultProfilesTest, UserRegistrationUnderDefaultNameFails) {
  ProfileRegistry registry;
  (void)register_default_profiles(registry);

  EXPECT_THROW(registry.register_config("default_cpu", test_utils::time_config()),
               DuplicateNameError);
}

TEST(DefaultProfilesTest, DefaultCpuReadsBenchmarkTime) {
  ProfileRegistry registry;
  (void)register_default_profiles(registry);
  auto cpu = registry.get("default_cpu");
  auto iter = registry.get("default_iter");

  auto run = test_utils::make_run("beam", 100, "exa", "ipopt", true, 0.5, 12);
  EXPECT_TRUE(cpu->includes(run));
  EXPECT_DOUBLE_EQ(*cpu->criterion().extract(run), 0.5);
  EXPECT_DOUBLE_EQ(*iter->criterion().extract(run), 12.0);

  auto no_iterations = test_utils::make_run("beam", 100, "exa", "ipopt", true, 0.5);
  EXPECT_TRUE(cpu->includes(no_iterations));
  EXPECT_FALSE(iter->includes(no_iterations));

  auto failed = test_utils::make_run("beam", 100, "exa", "ipopt", false, 0.5, 12);
  EXPECT_FALSE(cpu->includes(failed));
  EXPECT_FALSE(iter->includes(failed));
}

// =============================================================================
// Definitions from JSON
// =============================================================================

TEST(RegisterProfilesJsonTest, RegistersEveryEntry) {
  ProfileRegistry registry;
  register_profiles_json(registry, R"({
    "objective": {
      "instance_keys": ["problem"],
      "combo_keys": ["solver"],
      "criterion": {"name": "Objective", "field": "/objective", "sense": "higher"}
    },
    "memory": {
      "instance_keys": ["problem"],
      "combo_keys": ["solver"],
      "criterion": {"name": "Memory", "field": "/benchmark/memory"},
      "aggregate": "max"
    }
  })");

  EXPECT_EQ(registry.names(), (std::vector<std::string>{"memory", "objective"}));
  EXPECT_TRUE(registry.get("objective")->criterion().better(3.0, 1.0));
}

TEST(RegisterProfilesJsonTest, DuplicateLeavesRegistryUntouched) {
  ProfileRegistry registry;
  (void)register_default_profiles(registry);

  EXPECT_THROW(register_profiles_json(registry, R"({
    "another": {
      "instance_keys": ["problem"],
      "combo_keys": ["solver"],
      "criterion": {"name": "Time", "field": "/time"}
    },
    "default_cpu": {
      "instance_keys": ["problem"],
      "combo_keys": ["solver"],
      "criterion": {"name": "Time", "field": "/time"}
    }
  })"),
               DuplicateNameError);

  EXPECT_EQ(registry.size(), 2);
  EXPECT_FALSE(registry.contains("another"));
}

TEST(RegisterProfilesJsonTest, InvalidDefinitionsThrow) {
  ProfileRegistry registry;
  EXPECT_THROW(register_profiles_json(registry, "[1, 2, 3]"), std::invalid_argument);
  EXPECT_THROW(register_profiles_json(registry, "{not json"), nlohmann::json::parse_error);
  EXPECT_EQ(registry.size(), 0);
}

TEST(RegisterProfilesJsonTest, MissingFileThrows) {
  ProfileRegistry registry;
  EXPECT_THROW(register_profiles_file(registry, "/nonexistent/profiles.json"),
               std::runtime_error);
}
