#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "ms/error.h"

namespace ms::fs {

struct FileInfo {
  bool is_directory{false};
  std::uint64_t size{0};
};

// Read handle. Read returns 0 at end of stream.
class InputFile {
public:
  virtual ~InputFile() = default;

  virtual std::size_t Read(std::span<std::uint8_t> buffer) = 0;
  virtual void Close() = 0;
};

// Write handle. Sync forces written content to stable storage.
class OutputFile {
public:
  virtual ~OutputFile() = default;

  virtual void Write(std::span<const std::uint8_t> data) = 0;
  virtual void Sync() = 0;
  virtual void Close() = 0;
};

// Narrow capability interface over the filesystem operations the mirror and
// move passes need. Every operation throws ms::Error (domain IO, errno in
// native_code) on failure.
class Filesystem {
public:
  virtual ~Filesystem() = default;

  // lstat semantics: symbolic links are reported as non-directories.
  virtual FileInfo Stat(const std::filesystem::path& path) = 0;
  // Entry names (not paths), sorted lexically.
  virtual std::vector<std::string> ReadDir(const std::filesystem::path& path) = 0;
  virtual std::unique_ptr<InputFile> OpenRead(const std::filesystem::path& path) = 0;
  // Creates or truncates.
  virtual std::unique_ptr<OutputFile> Create(const std::filesystem::path& path) = 0;
  virtual void Rename(const std::filesystem::path& from, const std::filesystem::path& to) = 0;
  virtual void Remove(const std::filesystem::path& path) = 0;
  virtual void RemoveAll(const std::filesystem::path& path) = 0;
  // Creates a single directory level; the parent must exist.
  virtual void Mkdir(const std::filesystem::path& path) = 0;
};

// Returns std::nullopt when path does not exist; rethrows any other failure.
std::optional<FileInfo> StatIfExists(Filesystem& fs, const std::filesystem::path& path);

}  // namespace ms::fs
