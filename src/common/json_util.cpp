#include "engram/common/json_util.hpp"

#include <cctype>
#include <cstdio>
#include <sstream>

namespace engram::common {

namespace {

void append_utf8(std::string &out, unsigned int code_point) {
  if (code_point < 0x80) {
    out.push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  }
}

std::size_t value_start(const std::string &json, const std::string &field) {
  const auto key_pos = json_find_key(json, field);
  if (key_pos == std::string::npos) {
    return std::string::npos;
  }
  std::size_t pos = json_skip_ws(json, key_pos + field.size() + 2);
  if (pos >= json.size() || json[pos] != ':') {
    return std::string::npos;
  }
  pos = json_skip_ws(json, pos + 1);
  return pos < json.size() ? pos : std::string::npos;
}

std::string scalar_token(const std::string &json, std::size_t pos) {
  const std::size_t start = pos;
  while (pos < json.size()) {
    const char ch = json[pos];
    if (ch == ',' || ch == '}' || ch == ']' || std::isspace(static_cast<unsigned char>(ch)) != 0) {
      break;
    }
    ++pos;
  }
  return json.substr(start, pos - start);
}

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned int>(ch));
        escaped += buffer;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char next = raw[++i];
    switch (next) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u': {
      unsigned int code_point = 0;
      bool valid = i + 4 < raw.size();
      for (std::size_t k = 1; valid && k <= 4; ++k) {
        const char hex = raw[i + k];
        if (std::isxdigit(static_cast<unsigned char>(hex)) == 0) {
          valid = false;
          break;
        }
        const unsigned int digit =
            std::isdigit(static_cast<unsigned char>(hex)) != 0
                ? static_cast<unsigned int>(hex - '0')
                : static_cast<unsigned int>(std::tolower(static_cast<unsigned char>(hex)) - 'a' + 10);
        code_point = code_point * 16 + digit;
      }
      if (valid) {
        append_utf8(out, code_point);
        i += 4;
      } else {
        out.push_back('u');
      }
      break;
    }
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

std::string json_quote(const std::string &value) { return "\"" + json_escape(value) + "\""; }

std::size_t json_find_key(const std::string &json, const std::string &key, std::size_t from) {
  std::size_t depth = 0;
  for (std::size_t i = from; i < json.size(); ++i) {
    const char ch = json[i];
    if (ch == '"') {
      const auto end = json_find_string_end(json, i);
      if (end == std::string::npos) {
        return std::string::npos;
      }
      if (depth == 1 && end - i - 1 == key.size() && json.compare(i + 1, key.size(), key) == 0) {
        const auto after = json_skip_ws(json, end + 1);
        if (after < json.size() && json[after] == ':') {
          return i;
        }
      }
      i = end;
      continue;
    }
    if (ch == '{' || ch == '[') {
      ++depth;
    } else if (ch == '}' || ch == ']') {
      if (depth == 0) {
        return std::string::npos;
      }
      --depth;
    }
  }
  return std::string::npos;
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (!escaped && ch == '"') {
      return i;
    }
    if (!escaped && ch == '\\') {
      escaped = true;
      continue;
    }
    escaped = false;
  }
  return std::string::npos;
}

std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                      const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (ch == '"') {
      const auto end = json_find_string_end(json, i);
      if (end == std::string::npos) {
        return std::string::npos;
      }
      i = end;
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      if (depth == 0) {
        return std::string::npos;
      }
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

bool json_has_field(const std::string &json, const std::string &field) {
  return json_find_key(json, field) != std::string::npos;
}

std::string json_get_string(const std::string &json, const std::string &field) {
  const auto pos = value_start(json, field);
  if (pos == std::string::npos || json[pos] != '"') {
    return "";
  }
  const auto end = json_find_string_end(json, pos);
  if (end == std::string::npos) {
    return "";
  }
  return json_unescape(json.substr(pos + 1, end - pos - 1));
}

std::string json_get_number(const std::string &json, const std::string &field) {
  const auto pos = value_start(json, field);
  if (pos == std::string::npos) {
    return "";
  }
  const char first = json[pos];
  if (first != '-' && std::isdigit(static_cast<unsigned char>(first)) == 0) {
    return "";
  }
  return scalar_token(json, pos);
}

bool json_get_bool(const std::string &json, const std::string &field, const bool fallback) {
  const auto pos = value_start(json, field);
  if (pos == std::string::npos) {
    return fallback;
  }
  const std::string token = scalar_token(json, pos);
  if (token == "true") {
    return true;
  }
  if (token == "false") {
    return false;
  }
  return fallback;
}

std::string json_get_object(const std::string &json, const std::string &field) {
  const auto pos = value_start(json, field);
  if (pos == std::string::npos || json[pos] != '{') {
    return "";
  }
  const auto end = json_find_matching_token(json, pos, '{', '}');
  if (end == std::string::npos) {
    return "";
  }
  return json.substr(pos, end - pos + 1);
}

std::string json_get_array(const std::string &json, const std::string &field) {
  const auto pos = value_start(json, field);
  if (pos == std::string::npos || json[pos] != '[') {
    return "";
  }
  const auto end = json_find_matching_token(json, pos, '[', ']');
  if (end == std::string::npos) {
    return "";
  }
  return json.substr(pos, end - pos + 1);
}

std::vector<std::string> json_get_string_array(const std::string &json, const std::string &field) {
  const std::string array_str = json_get_array(json, field);
  if (array_str.empty()) {
    return {};
  }

  std::vector<std::string> out;
  std::size_t pos = 1;
  while (pos < array_str.size()) {
    pos = json_skip_ws(array_str, pos);
    if (pos >= array_str.size() || array_str[pos] == ']') {
      break;
    }
    if (array_str[pos] == ',') {
      ++pos;
      continue;
    }
    if (array_str[pos] == '"') {
      const auto end = json_find_string_end(array_str, pos);
      if (end == std::string::npos) {
        break;
      }
      out.push_back(json_unescape(array_str.substr(pos + 1, end - pos - 1)));
      pos = end + 1;
    } else {
      ++pos;
    }
  }
  return out;
}

JsonFlatMap json_parse_flat(const std::string &json) {
  JsonFlatMap result;
  if (json.size() < 2 || json.front() != '{') {
    return result;
  }

  std::size_t pos = 1;
  while (pos < json.size()) {
    pos = json_skip_ws(json, pos);
    if (pos >= json.size() || json[pos] == '}') {
      break;
    }
    if (json[pos] == ',') {
      ++pos;
      continue;
    }
    if (json[pos] != '"') {
      ++pos;
      continue;
    }
    const auto key_end = json_find_string_end(json, pos);
    if (key_end == std::string::npos) {
      break;
    }
    const std::string key = json_unescape(json.substr(pos + 1, key_end - pos - 1));
    pos = json_skip_ws(json, key_end + 1);
    if (pos >= json.size() || json[pos] != ':') {
      break;
    }
    pos = json_skip_ws(json, pos + 1);
    if (pos >= json.size()) {
      break;
    }

    if (json[pos] == '"') {
      const auto val_end = json_find_string_end(json, pos);
      if (val_end == std::string::npos) {
        break;
      }
      result[key] = json_unescape(json.substr(pos + 1, val_end - pos - 1));
      pos = val_end + 1;
    } else if (json[pos] == '{' || json[pos] == '[') {
      const char open = json[pos];
      const char close = (open == '{') ? '}' : ']';
      const auto end = json_find_matching_token(json, pos, open, close);
      if (end == std::string::npos) {
        break;
      }
      result[key] = json.substr(pos, end - pos + 1);
      pos = end + 1;
    } else {
      const std::string token = scalar_token(json, pos);
      result[key] = token;
      pos += token.size();
    }
  }

  return result;
}

std::vector<std::string> json_split_top_level_objects(const std::string &array_json) {
  std::vector<std::string> out;
  if (array_json.size() < 2 || array_json.front() != '[' || array_json.back() != ']') {
    return out;
  }

  std::size_t pos = 1;
  while (pos + 1 < array_json.size()) {
    const char ch = array_json[pos];
    if (ch == '"') {
      const auto end = json_find_string_end(array_json, pos);
      if (end == std::string::npos) {
        break;
      }
      pos = end + 1;
      continue;
    }
    if (ch == '{') {
      const auto end = json_find_matching_token(array_json, pos, '{', '}');
      if (end == std::string::npos) {
        break;
      }
      out.push_back(array_json.substr(pos, end - pos + 1));
      pos = end + 1;
      continue;
    }
    ++pos;
  }
  return out;
}

void JsonWriter::key(const std::string &key) {
  if (!body_.empty()) {
    body_.push_back(',');
  }
  body_ += json_quote(key);
  body_.push_back(':');
}

JsonWriter &JsonWriter::string(const std::string &name, const std::string &value) {
  key(name);
  body_ += json_quote(value);
  return *this;
}

JsonWriter &JsonWriter::boolean(const std::string &name, const bool value) {
  key(name);
  body_ += value ? "true" : "false";
  return *this;
}

JsonWriter &JsonWriter::integer(const std::string &name, const std::int64_t value) {
  key(name);
  body_ += std::to_string(value);
  return *this;
}

JsonWriter &JsonWriter::unsigned_integer(const std::string &name, const std::uint64_t value) {
  key(name);
  body_ += std::to_string(value);
  return *this;
}

JsonWriter &JsonWriter::null(const std::string &name) {
  key(name);
  body_ += "null";
  return *this;
}

JsonWriter &JsonWriter::raw(const std::string &name, const std::string &json_value) {
  key(name);
  body_ += json_value.empty() ? "null" : json_value;
  return *this;
}

std::string JsonWriter::str() const { return "{" + body_ + "}"; }

std::string json_string_array(const std::vector<std::string> &values) {
  std::vector<std::string> encoded;
  encoded.reserve(values.size());
  for (const auto &value : values) {
    encoded.push_back(json_quote(value));
  }
  return json_array(encoded);
}

std::string json_array(const std::vector<std::string> &raw_values) {
  std::string out = "[";
  for (std::size_t i = 0; i < raw_values.size(); ++i) {
    if (i > 0) {
      out.push_back(',');
    }
    out += raw_values[i];
  }
  out.push_back(']');
  return out;
}

} // namespace engram::common
