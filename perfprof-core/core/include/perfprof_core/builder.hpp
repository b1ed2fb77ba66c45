#pragma once
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "config.hpp"
#include "profile.hpp"
#include "record.hpp"

// Why a build produced no profile. An expected outcome, not an error.
enum class NoData {
  EmptyInput,          // no records, or none carrying the configured keys
  NoAllowedCombos,     // the combo filter excluded every record
  NoIncludedRecords,   // the inclusion predicate rejected every record
  NoComparableValues,  // no instance x combo produced a usable value
};

[[nodiscard]] std::string_view to_string(NoData reason) noexcept;

using ProfileResult = std::expected<PerformanceProfile, NoData>;

// Builds a performance profile. Pure and deterministic: the result depends
// only on the arguments and not on record order. Records missing a configured
// key are skipped. An absent or empty `allowed_combos` keeps every combo.
[[nodiscard]] ProfileResult build_profile(
    std::span<const BenchmarkRecord> records, const ProfileConfig& config,
    const std::optional<std::vector<KeyTuple>>& allowed_combos = std::nullopt,
    std::string_view bench_id = {});
