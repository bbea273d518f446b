#pragma once

#include "engram/common/result.hpp"

#include <cstddef>
#include <string>

namespace engram::dag {

constexpr std::size_t MAX_PATH_NAME_BYTES = 128;

/// Case-folds and punctuation-normalizes a path name so that "Feature X",
/// "feature_x" and "feature-x" name the same path. Bytes outside ASCII are
/// dropped. Fails with InvalidPath
/// when nothing usable remains or the result is too long.
[[nodiscard]] common::Result<std::string> normalize_path_name(const std::string &name);

} // namespace engram::dag
