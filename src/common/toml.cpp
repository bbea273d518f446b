#include "engram/common/toml.hpp"

#include "engram/common/fs.hpp"

#include <charconv>
#include <sstream>

namespace engram::common {

namespace {

std::string strip_comment(const std::string &line) {
  bool in_quotes = false;
  std::string output;
  output.reserve(line.size());

  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if (ch == '"' && (i == 0 || line[i - 1] != '\\')) {
      in_quotes = !in_quotes;
    }
    if (!in_quotes && ch == '#') {
      break;
    }
    output.push_back(ch);
  }

  return output;
}

std::vector<std::string> split_array_elements(const std::string &array_value) {
  std::vector<std::string> result;
  std::string current;
  bool in_quotes = false;

  for (std::size_t i = 0; i < array_value.size(); ++i) {
    const char ch = array_value[i];
    if (ch == '"' && (i == 0 || array_value[i - 1] != '\\')) {
      in_quotes = !in_quotes;
      current.push_back(ch);
      continue;
    }

    if (!in_quotes && ch == ',') {
      result.push_back(trim(current));
      current.clear();
      continue;
    }

    current.push_back(ch);
  }

  if (!trim(current).empty()) {
    result.push_back(trim(current));
  }

  return result;
}

std::string unquote(std::string value) {
  value = trim(value);
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    value = value.substr(1, value.size() - 2);
    std::string out;
    out.reserve(value.size());
    bool escaped = false;
    for (const char ch : value) {
      if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      if (escaped && ch == 'n') {
        out.push_back('\n');
      } else if (escaped && ch == 't') {
        out.push_back('\t');
      } else {
        out.push_back(ch);
      }
      escaped = false;
    }
    return out;
  }
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

// Net bracket depth of a value fragment, ignoring brackets inside strings.
int bracket_balance(const std::string &fragment) {
  int depth = 0;
  bool in_quotes = false;
  for (std::size_t i = 0; i < fragment.size(); ++i) {
    const char ch = fragment[i];
    if (ch == '"' && (i == 0 || fragment[i - 1] != '\\')) {
      in_quotes = !in_quotes;
      continue;
    }
    if (in_quotes) {
      continue;
    }
    if (ch == '[') {
      ++depth;
    } else if (ch == ']') {
      --depth;
    }
  }
  return depth;
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  return unquote(it->second);
}

bool TomlDocument::get_bool(const std::string &key, bool fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string normalized = to_lower(trim(it->second));
  if (normalized == "true") {
    return true;
  }
  if (normalized == "false") {
    return false;
  }
  return fallback;
}

std::uint64_t TomlDocument::get_u64(const std::string &key, std::uint64_t fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }

  const std::string normalized = trim(it->second);
  std::uint64_t parsed = 0;
  const auto *first = normalized.data();
  const auto *last = first + normalized.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last) {
    return fallback;
  }

  return parsed;
}

std::vector<std::string>
TomlDocument::get_string_array(const std::string &key,
                               const std::vector<std::string> &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }

  const std::string raw = trim(it->second);
  if (raw.size() < 2 || raw.front() != '[' || raw.back() != ']') {
    return fallback;
  }

  const std::string body = raw.substr(1, raw.size() - 2);
  std::vector<std::string> values_out;
  for (const auto &element : split_array_elements(body)) {
    if (!element.empty()) {
      values_out.push_back(unquote(element));
    }
  }

  return values_out;
}

std::size_t TomlDocument::table_array_size(const std::string &name) const {
  const auto it = table_arrays.find(name);
  return it == table_arrays.end() ? 0 : it->second;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string current_section;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean_line = trim(strip_comment(line));
    if (clean_line.empty()) {
      continue;
    }

    if (starts_with(clean_line, "[[") && clean_line.size() > 4 &&
        clean_line.compare(clean_line.size() - 2, 2, "]]") == 0) {
      const std::string name = trim(clean_line.substr(2, clean_line.size() - 4));
      if (name.empty()) {
        return Result<TomlDocument>::failure(ErrorCode::InvalidArgument,
                                             "Invalid empty table array at line " +
                                                 std::to_string(line_number));
      }
      const std::size_t index = document.table_arrays[name]++;
      current_section = name + "." + std::to_string(index);
      continue;
    }

    if (clean_line.front() == '[' && clean_line.back() == ']') {
      current_section = trim(clean_line.substr(1, clean_line.size() - 2));
      if (current_section.empty()) {
        return Result<TomlDocument>::failure(ErrorCode::InvalidArgument,
                                             "Invalid empty section at line " +
                                                 std::to_string(line_number));
      }
      continue;
    }

    const std::size_t equals_index = clean_line.find('=');
    if (equals_index == std::string::npos) {
      return Result<TomlDocument>::failure(ErrorCode::InvalidArgument,
                                           "Invalid key/value at line " +
                                               std::to_string(line_number));
    }

    const std::string key = trim(clean_line.substr(0, equals_index));
    std::string value = trim(clean_line.substr(equals_index + 1));
    if (key.empty()) {
      return Result<TomlDocument>::failure(ErrorCode::InvalidArgument,
                                           "Missing key at line " + std::to_string(line_number));
    }

    // Multi-line arrays continue until the brackets balance.
    int balance = bracket_balance(value);
    while (balance > 0 && std::getline(stream, line)) {
      ++line_number;
      const std::string continuation = trim(strip_comment(line));
      value += " " + continuation;
      balance += bracket_balance(continuation);
    }
    if (balance != 0) {
      return Result<TomlDocument>::failure(ErrorCode::InvalidArgument,
                                           "Unterminated array for key '" + key + "'");
    }

    const std::string full_key = current_section.empty() ? key : current_section + "." + key;
    document.values[full_key] = value;
  }

  return Result<TomlDocument>::success(std::move(document));
}

std::string quote_toml_string(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 2);
  escaped.push_back('"');
  for (const char ch : value) {
    if (ch == '"' || ch == '\\') {
      escaped.push_back('\\');
    }
    escaped.push_back(ch);
  }
  escaped.push_back('"');
  return escaped;
}

} // namespace engram::common
