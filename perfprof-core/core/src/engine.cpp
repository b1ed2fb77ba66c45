#include <format>
#include <perfprof_core/analyzer.hpp>
#include <perfprof_core/engine.hpp>
#include <stdexcept>

std::vector<KeyTuple> parse_combo_specs(std::span<const std::string> specs) {
  std::vector<KeyTuple> combos;
  combos.reserve(specs.size());

  for (const auto& spec : specs) {
    KeyTuple parts;
    size_t start = 0;
    while (true) {
      size_t end = spec.find(':', start);
      parts.push_back(spec.substr(start, end == std::string::npos ? end : end - start));
      if (end == std::string::npos) break;
      start = end + 1;
    }

    for (const auto& part : parts) {
      if (part.empty()) {
        throw std::invalid_argument(
            std::format("Invalid combo specification '{}'. Expected 'model:solver'.", spec));
      }
    }
    combos.push_back(std::move(parts));
  }
  return combos;
}

ProfileResult build_from_registry(const ProfileRegistry& registry, const std::string& name,
                                  std::span<const BenchmarkRecord> records,
                                  std::string_view bench_id,
                                  const std::optional<std::vector<KeyTuple>>& combos) {
  auto config = registry.get(name);
  return build_profile(records, *config, combos, bench_id);
}

std::string analyze_from_registry(const ProfileRegistry& registry, const std::string& name,
                                  std::span<const BenchmarkRecord> records,
                                  std::string_view bench_id,
                                  const std::optional<std::vector<KeyTuple>>& combos) {
  auto profile = build_from_registry(registry, name, records, bench_id, combos);
  if (!profile) {
    return no_data_message(bench_id, profile.error());
  }
  return analyze_profile(*profile);
}
