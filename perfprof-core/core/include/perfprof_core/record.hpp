#pragma once
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <span>
#include <string>
#include <vector>

// Identity of an instance or a combo: one value per key, in key order
using KeyTuple = std::vector<std::string>;

// One benchmark observation (instance x combo x run). Never mutated by the engine.
struct BenchmarkRecord {
  std::map<std::string, std::string> keys;  // e.g. problem, grid_size, model, solver
  bool success = false;
  nlohmann::json payload;                   // e.g. {"benchmark": {"time": 0.4}, "iterations": 12}
};

// Values of `keys` in order, or nullopt if the record lacks one of them
[[nodiscard]] std::optional<KeyTuple> project_keys(const BenchmarkRecord& record,
                                                   std::span<const std::string> keys);

// "(a, b)" label used in reports
[[nodiscard]] std::string format_key(const KeyTuple& key);
