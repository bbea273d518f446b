#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace engram::common {

[[nodiscard]] std::string json_escape(const std::string &value);

[[nodiscard]] std::string json_unescape(const std::string &raw);

[[nodiscard]] std::string json_quote(const std::string &value);

/// Position of a key of the outermost object, or npos. Keys of nested
/// objects and key-like text inside strings are never matched.
[[nodiscard]] std::size_t json_find_key(const std::string &json, const std::string &key,
                                        std::size_t from = 0);

[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

[[nodiscard]] bool json_has_field(const std::string &json, const std::string &field);
[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);
[[nodiscard]] std::string json_get_number(const std::string &json, const std::string &field);
[[nodiscard]] bool json_get_bool(const std::string &json, const std::string &field,
                                 bool fallback);
[[nodiscard]] std::string json_get_object(const std::string &json, const std::string &field);
[[nodiscard]] std::string json_get_array(const std::string &json, const std::string &field);
[[nodiscard]] std::vector<std::string> json_get_string_array(const std::string &json,
                                                              const std::string &field);

using JsonFlatMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

[[nodiscard]] std::vector<std::string> json_split_top_level_objects(const std::string &array_json);

class JsonWriter {
public:
  JsonWriter &string(const std::string &key, const std::string &value);
  JsonWriter &boolean(const std::string &key, bool value);
  JsonWriter &integer(const std::string &key, std::int64_t value);
  JsonWriter &unsigned_integer(const std::string &key, std::uint64_t value);
  JsonWriter &null(const std::string &key);
  JsonWriter &raw(const std::string &key, const std::string &json_value);

  [[nodiscard]] std::string str() const;

private:
  void key(const std::string &key);

  std::string body_;
};

[[nodiscard]] std::string json_string_array(const std::vector<std::string> &values);
[[nodiscard]] std::string json_array(const std::vector<std::string> &raw_values);

} // namespace engram::common
