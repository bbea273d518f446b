#pragma once

#include <string>

namespace engram::common {

[[nodiscard]] std::string sha256_hex(const std::string &bytes);

[[nodiscard]] bool is_sha256_hex(const std::string &text);

} // namespace engram::common
