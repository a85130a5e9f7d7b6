#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "ms/fs/filesystem.h"

namespace ms::fs {

// Filesystem backed by POSIX system calls. New files and directories are
// created with 0666/0777 so the caller's umask decides the final mode.
class OsFilesystem : public Filesystem {
public:
  FileInfo Stat(const std::filesystem::path& path) override;
  std::vector<std::string> ReadDir(const std::filesystem::path& path) override;
  std::unique_ptr<InputFile> OpenRead(const std::filesystem::path& path) override;
  std::unique_ptr<OutputFile> Create(const std::filesystem::path& path) override;
  void Rename(const std::filesystem::path& from, const std::filesystem::path& to) override;
  void Remove(const std::filesystem::path& path) override;
  void RemoveAll(const std::filesystem::path& path) override;
  void Mkdir(const std::filesystem::path& path) override;
};

}  // namespace ms::fs
