#pragma once
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "builder.hpp"
#include "registry.hpp"

// Parses "model:solver" style specs into combo tuples
[[nodiscard]] std::vector<KeyTuple> parse_combo_specs(std::span<const std::string> specs);

// Builds with the configuration registered under `name` (NotFoundError if absent)
[[nodiscard]] ProfileResult build_from_registry(
    const ProfileRegistry& registry, const std::string& name,
    std::span<const BenchmarkRecord> records, std::string_view bench_id,
    const std::optional<std::vector<KeyTuple>>& combos = std::nullopt);

// Analysis text, or the placeholder when there is nothing to analyze
[[nodiscard]] std::string analyze_from_registry(
    const ProfileRegistry& registry, const std::string& name,
    std::span<const BenchmarkRecord> records, std::string_view bench_id,
    const std::optional<std::vector<KeyTuple>>& combos = std::nullopt);
