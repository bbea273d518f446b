#pragma once

#include <chrono>
#include <string>

namespace engram::common {

[[nodiscard]] std::string format_rfc3339(std::chrono::system_clock::time_point point);
[[nodiscard]] std::string now_rfc3339();

} // namespace engram::common
