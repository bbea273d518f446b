#include "engram/runtime/writer_lock.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <string>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace engram::runtime {

WriterLock::WriterLock(std::filesystem::path path) : path_(std::move(path)) {}

WriterLock::~WriterLock() { release(); }

common::Status WriterLock::acquire() {
  if (held()) {
    return common::Status::success();
  }

  std::error_code ec;
  std::filesystem::create_directories(path_.parent_path(), ec);
  if (ec) {
    return common::Status::error(common::ErrorCode::StorageUnavailable,
                                 "failed to create workspace directory: " + ec.message());
  }

  const int fd = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) {
    return common::Status::error(common::ErrorCode::StorageUnavailable,
                                 "cannot open " + path_.string() + ": " + std::strerror(errno));
  }

  if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
    const int err = errno;
    ::close(fd);
    if (err == EWOULDBLOCK) {
      const int holder = recorded_pid(path_);
      return common::Status::error(common::ErrorCode::StorageUnavailable,
                                   "workspace is locked by another writer" +
                                       (holder > 0 ? " (pid " + std::to_string(holder) + ")"
                                                   : std::string()));
    }
    return common::Status::error(common::ErrorCode::StorageUnavailable,
                                 "flock " + path_.string() + ": " + std::strerror(err));
  }

  const std::string pid = std::to_string(static_cast<int>(getpid())) + "\n";
  if (::ftruncate(fd, 0) != 0 ||
      ::pwrite(fd, pid.data(), pid.size(), 0) != static_cast<ssize_t>(pid.size())) {
    const int err = errno;
    ::flock(fd, LOCK_UN);
    ::close(fd);
    return common::Status::error(common::ErrorCode::StorageUnavailable,
                                 "failed to record pid in lock file: " + std::string(std::strerror(err)));
  }

  fd_ = fd;
  return common::Status::success();
}

void WriterLock::release() {
  if (!held()) {
    return;
  }
  // The file stays; removing it would race with a concurrent acquire.
  ::flock(fd_, LOCK_UN);
  ::close(fd_);
  fd_ = -1;
}

int WriterLock::recorded_pid(const std::filesystem::path &path) {
  std::ifstream in(path);
  int pid = 0;
  in >> pid;
  return pid > 0 ? pid : 0;
}

} // namespace engram::runtime
