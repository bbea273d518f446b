#pragma once

#include "engram/common/result.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace engram::common {

/// Flat view of a TOML document. Keys are dotted (`section.key`); entries of
/// an array of tables are indexed (`rules.0.id`, `rules.1.id`, ...).
struct TomlDocument {
  std::unordered_map<std::string, std::string> values;
  std::unordered_map<std::string, std::size_t> table_arrays;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] std::uint64_t get_u64(const std::string &key, std::uint64_t fallback) const;
  [[nodiscard]] std::vector<std::string>
  get_string_array(const std::string &key, const std::vector<std::string> &fallback = {}) const;
  [[nodiscard]] std::size_t table_array_size(const std::string &name) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);
[[nodiscard]] std::string quote_toml_string(const std::string &value);

} // namespace engram::common
