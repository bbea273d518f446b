#pragma once

#include "engram/common/result.hpp"

#include <filesystem>

namespace engram::runtime {

/// Exclusive per-workspace writer handle backed by flock(2) on a lock file
/// that records the holder's pid. Released on destruction.
class WriterLock {
public:
  explicit WriterLock(std::filesystem::path path);
  ~WriterLock();
  WriterLock(const WriterLock &) = delete;
  WriterLock &operator=(const WriterLock &) = delete;

  [[nodiscard]] common::Status acquire();
  void release();

  [[nodiscard]] bool held() const { return fd_ >= 0; }
  [[nodiscard]] const std::filesystem::path &path() const { return path_; }

  [[nodiscard]] static int recorded_pid(const std::filesystem::path &path);

private:
  std::filesystem::path path_;
  int fd_ = -1;
};

} // namespace engram::runtime
