#include "engram/dag/path_name.hpp"

#include <cctype>

namespace engram::dag {

common::Result<std::string> normalize_path_name(const std::string &name) {
  std::string out;
  out.reserve(name.size());
  for (const char ch : name) {
    const auto uch = static_cast<unsigned char>(ch);
    if (uch >= 0x80) {
      // Non-ASCII bytes are dropped so names stay ASCII and case folding is total.
      continue;
    }
    if (std::isalnum(uch) != 0) {
      out.push_back(static_cast<char>(std::tolower(uch)));
    } else if (out.empty() || out.back() != '-') {
      out.push_back('-');
    }
  }

  while (!out.empty() && out.front() == '-') {
    out.erase(out.begin());
  }
  while (!out.empty() && out.back() == '-') {
    out.pop_back();
  }

  if (out.empty()) {
    return common::Result<std::string>::failure(
        common::ErrorCode::InvalidPath, "path name '" + name + "' is empty after normalization");
  }
  if (out.size() > MAX_PATH_NAME_BYTES) {
    return common::Result<std::string>::failure(
        common::ErrorCode::InvalidPath,
        "path name exceeds " + std::to_string(MAX_PATH_NAME_BYTES) + " bytes");
  }
  return common::Result<std::string>::success(std::move(out));
}

} // namespace engram::dag
