#include <perfprof_core/record.hpp>

std::optional<KeyTuple> project_keys(const BenchmarkRecord& record,
                                     std::span<const std::string> keys) {
  KeyTuple tuple;
  tuple.reserve(keys.size());
  for (const auto& key : keys) {
    auto it = record.keys.find(key);
    if (it == record.keys.end()) {
      return std::nullopt;
    }
    tuple.push_back(it->second);
  }
  return tuple;
}

std::string format_key(const KeyTuple& key) {
  std::string label = "(";
  for (size_t i = 0; i < key.size(); ++i) {
    if (i > 0) label += ", ";
    label += key[i];
  }
  label += ")";
  return label;
}
