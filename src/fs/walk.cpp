#include "ms/fs/walk.h"

#include <string>
#include <vector>

namespace ms::fs {
namespace {

// Returns false once the walk has to stop.
bool WalkNode(Filesystem& fs, const std::filesystem::path& path, const FileInfo& info,
              const WalkCallback& callback) {
  WalkEntry entry{path, info, std::nullopt};
  const auto action = callback(entry);
  if (action == WalkAction::kStop) {
    return false;
  }
  if (!info.is_directory || action == WalkAction::kSkipSubtree) {
    return true;
  }

  std::vector<std::string> names;
  try {
    names = fs.ReadDir(path);
  } catch (const Error& err) {
    WalkEntry failed{path, info, err};
    return callback(failed) != WalkAction::kStop;
  }

  for (const auto& name : names) {
    const auto child = path / name;
    std::optional<FileInfo> child_info;
    try {
      child_info = fs.Stat(child);
    } catch (const Error& err) {
      WalkEntry failed{child, std::nullopt, err};
      if (callback(failed) == WalkAction::kStop) {
        return false;
      }
      continue;
    }
    if (!WalkNode(fs, child, *child_info, callback)) {
      return false;
    }
  }
  return true;
}

}  // namespace

void Walk(Filesystem& fs, const std::filesystem::path& root, const WalkCallback& callback) {
  FileInfo root_info;
  try {
    root_info = fs.Stat(root);
  } catch (const Error& err) {
    WalkEntry failed{root, std::nullopt, err};
    callback(failed);
    return;
  }
  WalkNode(fs, root, root_info, callback);
}

}  // namespace ms::fs
