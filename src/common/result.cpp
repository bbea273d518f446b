#include "engram/common/result.hpp"

namespace engram::common {

std::string_view error_code_name(const ErrorCode code) {
  switch (code) {
  case ErrorCode::None:
    return "ok";
  case ErrorCode::NotFound:
    return "not_found";
  case ErrorCode::InvalidPath:
    return "invalid_path";
  case ErrorCode::EthicsBlocked:
    return "ethics_blocked";
  case ErrorCode::NonFastForward:
    return "non_fast_forward";
  case ErrorCode::IntegrityMismatch:
    return "integrity_mismatch";
  case ErrorCode::ConcurrentWriteConflict:
    return "concurrent_write_conflict";
  case ErrorCode::StorageUnavailable:
    return "storage_unavailable";
  case ErrorCode::Unsupported:
    return "unsupported";
  case ErrorCode::InvalidArgument:
    return "invalid_argument";
  case ErrorCode::Internal:
    return "internal";
  }
  return "internal";
}

} // namespace engram::common
