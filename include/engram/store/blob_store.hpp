#pragma once

#include "engram/common/result.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace engram::store {

struct PutOutcome {
  std::string cid;
  bool created = false;
};

/// Durable, deduplicated object storage keyed by the SHA-256 of the bytes.
/// Objects live at `<root>/<cid[0..2]>/<cid>` and are written atomically.
class BlobStore {
public:
  BlobStore(std::filesystem::path root, std::uint64_t max_object_bytes);

  [[nodiscard]] common::Result<PutOutcome> put(const std::string &bytes);
  [[nodiscard]] common::Result<std::string> get(const std::string &cid) const;
  [[nodiscard]] bool contains(const std::string &cid) const;
  [[nodiscard]] common::Status verify(const std::string &cid) const;

  [[nodiscard]] common::Status remove_uncommitted(const std::string &cid);

  [[nodiscard]] common::Result<std::size_t> count() const;
  [[nodiscard]] bool health_check() const;
  [[nodiscard]] const std::filesystem::path &root() const { return root_; }
  [[nodiscard]] std::filesystem::path object_path(const std::string &cid) const;

private:
  std::filesystem::path root_;
  std::uint64_t max_object_bytes_;
};

} // namespace engram::store
