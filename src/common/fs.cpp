#include "engram/common/fs.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <regex>
#include <sstream>

#include <unistd.h>

namespace engram::common {

namespace {

std::atomic<std::uint64_t> g_temp_counter{0};

} // namespace

std::string trim(const std::string &input) {
  auto first = std::find_if_not(input.begin(), input.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  auto last = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char c) {
    return std::isspace(c) != 0;
  }).base();

  if (first >= last) {
    return "";
  }
  return std::string(first, last);
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.rfind(prefix, 0) == 0;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

Result<std::filesystem::path> home_dir() {
  if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return Result<std::filesystem::path>::success(std::filesystem::path(home));
  }
  return Result<std::filesystem::path>::failure(ErrorCode::NotFound, "HOME is not set");
}

Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return Result<std::filesystem::path>::failure(
        ErrorCode::StorageUnavailable,
        "Failed to create directory: " + path.string() + ": " + ec.message());
  }
  return Result<std::filesystem::path>::success(path);
}

std::string expand_path(std::string value) {
  if (value.empty()) {
    return value;
  }

  if (value[0] == '~') {
    if (auto home = home_dir(); home.ok()) {
      value.replace(0, 1, home.value().string());
    }
  }

  std::regex env_pattern(R"(\$\{?([A-Za-z_][A-Za-z0-9_]*)\}?)");
  std::smatch match;
  std::string expanded;
  std::string remaining = value;

  while (std::regex_search(remaining, match, env_pattern)) {
    expanded += match.prefix().str();
    const std::string var_name = match[1].str();
    if (const char *var = std::getenv(var_name.c_str()); var != nullptr) {
      expanded += var;
    }
    remaining = match.suffix().str();
  }

  expanded += remaining;
  return expanded;
}

Result<std::string> read_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return Result<std::string>::failure(ErrorCode::NotFound, "no such file: " + path.string());
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return Result<std::string>::failure(ErrorCode::StorageUnavailable,
                                        "unable to open " + path.string());
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    return Result<std::string>::failure(ErrorCode::StorageUnavailable,
                                        "read failed: " + path.string());
  }
  return Result<std::string>::success(buffer.str());
}

Status write_file_atomic(const std::filesystem::path &path, const std::string &bytes) {
  if (path.has_parent_path()) {
    auto dir = ensure_dir(path.parent_path());
    if (!dir.ok()) {
      return dir.status();
    }
  }

  auto tmp = path;
  tmp += ".tmp." + std::to_string(static_cast<long long>(getpid())) + "." +
         std::to_string(g_temp_counter.fetch_add(1));
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      return Status::error(ErrorCode::StorageUnavailable, "unable to open " + tmp.string());
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out) {
      std::error_code ignored;
      std::filesystem::remove(tmp, ignored);
      return Status::error(ErrorCode::StorageUnavailable, "write failed: " + tmp.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(tmp, ignored);
    return Status::error(ErrorCode::StorageUnavailable,
                         "rename " + tmp.string() + " -> " + path.string() + ": " + ec.message());
  }
  return Status::success();
}

Status append_line(const std::filesystem::path &path, const std::string &line) {
  if (path.has_parent_path()) {
    auto dir = ensure_dir(path.parent_path());
    if (!dir.ok()) {
      return dir.status();
    }
  }

  std::ofstream out(path, std::ios::binary | std::ios::app);
  if (!out) {
    return Status::error(ErrorCode::StorageUnavailable, "unable to open " + path.string());
  }
  out << line << '\n';
  out.flush();
  if (!out) {
    return Status::error(ErrorCode::StorageUnavailable, "append failed: " + path.string());
  }
  return Status::success();
}

} // namespace engram::common
