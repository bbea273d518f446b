#pragma once

#include "engram/common/result.hpp"

#include <filesystem>
#include <string>

namespace engram::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

[[nodiscard]] Status write_file_atomic(const std::filesystem::path &path, const std::string &bytes);

[[nodiscard]] Status append_line(const std::filesystem::path &path, const std::string &line);

} // namespace engram::common
