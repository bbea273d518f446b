#include "engram/dag/record.hpp"

#include "engram/common/clock.hpp"
#include "engram/common/digest.hpp"
#include "engram/common/json_util.hpp"

namespace engram::dag {

namespace {

constexpr const char *ID_DOMAIN = "engram/v1\n";

void frame(std::string &out, const std::string &field) {
  out += std::to_string(field.size());
  out.push_back(':');
  out += field;
  out.push_back('\n');
}

} // namespace

std::string compute_record_id(const std::string &lobe, const std::string &key,
                              const std::optional<std::string> &parent,
                              const std::string &payload) {
  std::string framed = ID_DOMAIN;
  framed.reserve(framed.size() + lobe.size() + key.size() + payload.size() + 96);
  frame(framed, lobe);
  frame(framed, key);
  frame(framed, parent.value_or(""));
  frame(framed, payload);
  return common::sha256_hex(framed);
}

Record make_record(std::string lobe, std::string key, std::string payload,
                   std::optional<std::string> parent, Tags tags) {
  Record record;
  record.id = compute_record_id(lobe, key, parent, payload);
  record.cid = common::sha256_hex(payload);
  record.payload = std::move(payload);
  record.lobe = std::move(lobe);
  record.key = std::move(key);
  record.parent = std::move(parent);
  record.created_at = common::now_rfc3339();
  record.tags = std::move(tags);
  return record;
}

bool verify_record(const Record &record) {
  return record.cid == common::sha256_hex(record.payload) &&
         record.id == compute_record_id(record.lobe, record.key, record.parent, record.payload);
}

std::string encode_tags(const Tags &tags) {
  common::JsonWriter writer;
  for (const auto &[name, value] : tags) {
    writer.string(name, value);
  }
  return writer.str();
}

Tags decode_tags(const std::string &json) {
  Tags tags;
  for (auto &[name, value] : common::json_parse_flat(json)) {
    tags.emplace(name, value);
  }
  return tags;
}

} // namespace engram::dag
