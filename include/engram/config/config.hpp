#pragma once

#include "engram/common/result.hpp"
#include "engram/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace engram::config {

[[nodiscard]] common::Result<std::filesystem::path>
resolve_root(const std::optional<std::filesystem::path> &explicit_root = std::nullopt);

[[nodiscard]] std::filesystem::path config_path(const std::filesystem::path &root);

[[nodiscard]] common::Result<Config> load_config(const std::filesystem::path &root);
[[nodiscard]] common::Result<Config> parse_config(const std::string &toml_text);
[[nodiscard]] common::Status save_config(const std::filesystem::path &root, const Config &config);

[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace engram::config
