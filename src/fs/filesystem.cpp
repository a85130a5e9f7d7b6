#include "ms/fs/filesystem.h"

namespace ms::fs {

std::optional<FileInfo> StatIfExists(Filesystem& fs, const std::filesystem::path& path) {
  try {
    return fs.Stat(path);
  } catch (const Error& err) {
    if (IsNotFound(err)) {
      return std::nullopt;
    }
    throw;
  }
}

}  // namespace ms::fs
