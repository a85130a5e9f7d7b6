#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ms/fs/filesystem.h"

namespace ms::fs {

// Fault-injection seams. A hook that throws makes the corresponding
// operation fail before it touches any state.
struct MemoryFilesystemHooks {
  std::function<void(const std::filesystem::path&)> before_stat;
  std::function<void(const std::filesystem::path&)> before_read_dir;
  std::function<void(const std::filesystem::path&)> before_open;
  std::function<void(const std::filesystem::path&)> before_create;
  std::function<void(const std::filesystem::path&, const std::filesystem::path&)> before_rename;
  std::function<void(const std::filesystem::path&)> before_remove;
  std::function<void(const std::filesystem::path&)> before_mkdir;
  // Output handle seams; the path is the file being written.
  std::function<void(const std::filesystem::path&)> before_write;
  std::function<void(const std::filesystem::path&)> before_sync;
  std::function<void(const std::filesystem::path&)> before_close;
};

// Builds the ms::Error an injected fault should raise, matching what
// OsFilesystem reports for the same errno.
Error MakeInjectedFault(int err, std::string_view operation, const std::filesystem::path& path);

// In-memory filesystem double with POSIX-like semantics for the operations
// the transfer engine uses. The root directory "/" always exists. Output
// handles consult the hooks, so they must not outlive the filesystem.
class MemoryFilesystem : public Filesystem {
public:
  MemoryFilesystem();

  MemoryFilesystemHooks& Hooks() noexcept { return hooks_; }

  // Setup helpers; both create missing parent directories.
  void WriteFile(const std::filesystem::path& path, std::string_view content);
  void MakeDirectories(const std::filesystem::path& path);

  [[nodiscard]] std::optional<std::string> ReadFile(const std::filesystem::path& path) const;
  [[nodiscard]] bool Exists(const std::filesystem::path& path) const;
  [[nodiscard]] bool IsDirectory(const std::filesystem::path& path) const;
  // Number of mutating operations performed through the Filesystem interface.
  [[nodiscard]] std::uint64_t MutationCount() const noexcept { return mutations_; }

  FileInfo Stat(const std::filesystem::path& path) override;
  std::vector<std::string> ReadDir(const std::filesystem::path& path) override;
  std::unique_ptr<InputFile> OpenRead(const std::filesystem::path& path) override;
  std::unique_ptr<OutputFile> Create(const std::filesystem::path& path) override;
  void Rename(const std::filesystem::path& from, const std::filesystem::path& to) override;
  void Remove(const std::filesystem::path& path) override;
  void RemoveAll(const std::filesystem::path& path) override;
  void Mkdir(const std::filesystem::path& path) override;

private:
  using Buffer = std::vector<std::uint8_t>;

  struct Node {
    bool is_directory{false};
    std::shared_ptr<Buffer> data;
  };

  static std::string Key(const std::filesystem::path& path);
  static std::string ParentKey(const std::string& key);
  static std::string ChildPrefix(const std::string& key);

  const Node* Find(const std::string& key) const;
  bool HasChildren(const std::string& key) const;
  void RequireParentDirectory(const std::string& key, std::string_view operation,
                              const std::filesystem::path& path) const;

  std::map<std::string, Node> nodes_;
  MemoryFilesystemHooks hooks_;
  std::uint64_t mutations_{0};
};

}  // namespace ms::fs
