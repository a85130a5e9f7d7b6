#pragma once

#include <filesystem>
#include <functional>
#include <optional>

#include "ms/error.h"
#include "ms/fs/filesystem.h"

namespace ms::fs {

enum class WalkAction {
  kContinue,
  kSkipSubtree,  // on a file: same as kContinue
  kStop
};

struct WalkEntry {
  std::filesystem::path path;
  std::optional<FileInfo> info;  // absent when the entry could not be stat'ed
  std::optional<Error> error;

  [[nodiscard]] bool IsDirectory() const noexcept { return info.has_value() && info->is_directory; }
};

using WalkCallback = std::function<WalkAction(const WalkEntry&)>;

// Depth-first pre-order traversal rooted at root, visiting directory entries
// in lexical order. A directory that cannot be listed is reported a second
// time with the listing error attached. Exceptions thrown by the callback
// abort the walk and propagate to the caller.
void Walk(Filesystem& fs, const std::filesystem::path& root, const WalkCallback& callback);

}  // namespace ms::fs
