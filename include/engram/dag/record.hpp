#pragma once

#include <map>
#include <optional>
#include <string>

namespace engram::dag {

using Tags = std::map<std::string, std::string>;

struct Record {
  std::string id;
  std::string cid;
  std::string payload;
  std::string lobe;
  std::string key;
  std::optional<std::string> parent;
  std::string created_at;
  Tags tags;
};

/// SHA-256 over the length-prefixed essential fields. `created_at` and tags
/// do not take part, so the same content under the same parent always has
/// the same id.
[[nodiscard]] std::string compute_record_id(const std::string &lobe, const std::string &key,
                                            const std::optional<std::string> &parent,
                                            const std::string &payload);

[[nodiscard]] Record make_record(std::string lobe, std::string key, std::string payload,
                                 std::optional<std::string> parent, Tags tags = {});

[[nodiscard]] bool verify_record(const Record &record);

[[nodiscard]] std::string encode_tags(const Tags &tags);
[[nodiscard]] Tags decode_tags(const std::string &json);

} // namespace engram::dag
