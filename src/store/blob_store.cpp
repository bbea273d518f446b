#include "engram/store/blob_store.hpp"

#include "engram/common/digest.hpp"
#include "engram/common/fs.hpp"

namespace engram::store {

BlobStore::BlobStore(std::filesystem::path root, const std::uint64_t max_object_bytes)
    : root_(std::move(root)), max_object_bytes_(max_object_bytes) {}

std::filesystem::path BlobStore::object_path(const std::string &cid) const {
  return root_ / cid.substr(0, 2) / cid;
}

common::Result<PutOutcome> BlobStore::put(const std::string &bytes) {
  if (bytes.size() > max_object_bytes_) {
    return common::Result<PutOutcome>::failure(
        common::ErrorCode::InvalidArgument,
        "object of " + std::to_string(bytes.size()) + " bytes exceeds storage.max_object_bytes (" +
            std::to_string(max_object_bytes_) + ")");
  }

  PutOutcome outcome;
  outcome.cid = common::sha256_hex(bytes);
  const auto path = object_path(outcome.cid);

  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    return common::Result<PutOutcome>::success(std::move(outcome));
  }
  if (ec) {
    return common::Result<PutOutcome>::failure(common::ErrorCode::StorageUnavailable,
                                               "stat " + path.string() + ": " + ec.message());
  }

  const auto written = common::write_file_atomic(path, bytes);
  if (!written.ok()) {
    return common::Result<PutOutcome>::failure(written);
  }
  outcome.created = true;
  return common::Result<PutOutcome>::success(std::move(outcome));
}

common::Result<std::string> BlobStore::get(const std::string &cid) const {
  if (!common::is_sha256_hex(cid)) {
    return common::Result<std::string>::failure(common::ErrorCode::NotFound,
                                                "not a blob key: " + cid);
  }

  auto bytes = common::read_file(object_path(cid));
  if (!bytes.ok()) {
    if (bytes.code() == common::ErrorCode::NotFound) {
      return common::Result<std::string>::failure(common::ErrorCode::NotFound,
                                                  "blob " + cid + " not found");
    }
    return bytes;
  }

  if (common::sha256_hex(bytes.value()) != cid) {
    return common::Result<std::string>::failure(common::ErrorCode::IntegrityMismatch,
                                                "blob " + cid + " no longer matches its digest");
  }
  return bytes;
}

bool BlobStore::contains(const std::string &cid) const {
  if (!common::is_sha256_hex(cid)) {
    return false;
  }
  std::error_code ec;
  return std::filesystem::is_regular_file(object_path(cid), ec);
}

common::Status BlobStore::verify(const std::string &cid) const {
  const auto bytes = get(cid);
  return bytes.status();
}

common::Status BlobStore::remove_uncommitted(const std::string &cid) {
  if (!common::is_sha256_hex(cid)) {
    return common::Status::error(common::ErrorCode::InvalidArgument, "not a blob key: " + cid);
  }
  std::error_code ec;
  std::filesystem::remove(object_path(cid), ec);
  if (ec) {
    return common::Status::error(common::ErrorCode::StorageUnavailable,
                                 "remove " + cid + ": " + ec.message());
  }
  return common::Status::success();
}

common::Result<std::size_t> BlobStore::count() const {
  std::size_t total = 0;
  std::error_code ec;
  if (!std::filesystem::exists(root_, ec)) {
    return common::Result<std::size_t>::success(0);
  }
  for (std::filesystem::recursive_directory_iterator it(root_, ec), end; !ec && it != end;
       it.increment(ec)) {
    if (it->is_regular_file() && common::is_sha256_hex(it->path().filename().string())) {
      ++total;
    }
  }
  if (ec) {
    return common::Result<std::size_t>::failure(common::ErrorCode::StorageUnavailable,
                                                "scan " + root_.string() + ": " + ec.message());
  }
  return common::Result<std::size_t>::success(total);
}

bool BlobStore::health_check() const {
  std::error_code ec;
  return std::filesystem::is_directory(root_, ec);
}

} // namespace engram::store
