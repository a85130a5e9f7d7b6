#include "ms/fs/memory_filesystem.h"

#include "ms/common.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <utility>

namespace ms::fs {
namespace {

class MemoryInputFile : public InputFile {
public:
  MemoryInputFile(std::vector<std::uint8_t> snapshot, std::filesystem::path path)
      : data_(std::move(snapshot)), path_(std::move(path)) {}

  std::size_t Read(std::span<std::uint8_t> buffer) override {
    if (closed_) {
      throw MakeInjectedFault(EBADF, "read", path_);
    }
    const std::size_t remaining = data_.size() - offset_;
    const std::size_t count = std::min(remaining, buffer.size());
    std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(offset_), count, buffer.begin());
    offset_ += count;
    return count;
  }

  void Close() override { closed_ = true; }

private:
  std::vector<std::uint8_t> data_;
  std::filesystem::path path_;
  std::size_t offset_{0};
  bool closed_{false};
};

class MemoryOutputFile : public OutputFile {
public:
  MemoryOutputFile(std::shared_ptr<std::vector<std::uint8_t>> data, std::filesystem::path path,
                   const MemoryFilesystemHooks& hooks)
      : data_(std::move(data)), path_(std::move(path)), hooks_(hooks) {}

  void Write(std::span<const std::uint8_t> bytes) override {
    if (closed_) {
      throw MakeInjectedFault(EBADF, "write", path_);
    }
    if (hooks_.before_write) {
      hooks_.before_write(path_);
    }
    data_->insert(data_->end(), bytes.begin(), bytes.end());
  }

  void Sync() override {
    if (closed_) {
      throw MakeInjectedFault(EBADF, "sync", path_);
    }
    if (hooks_.before_sync) {
      hooks_.before_sync(path_);
    }
  }

  void Close() override {
    if (closed_) {
      return;
    }
    closed_ = true;
    if (hooks_.before_close) {
      hooks_.before_close(path_);
    }
  }

private:
  std::shared_ptr<std::vector<std::uint8_t>> data_;
  std::filesystem::path path_;
  const MemoryFilesystemHooks& hooks_;
  bool closed_{false};
};

}  // namespace

Error MakeInjectedFault(int err, std::string_view operation, const std::filesystem::path& path) {
  return Error{ErrorDomain::IO,
               err,
               "failed to " + std::string(operation) + ": " + QuotePath(path) + " (" +
                   std::strerror(err) + ")",
               err};
}

MemoryFilesystem::MemoryFilesystem() {
  nodes_.emplace("/", Node{true, nullptr});
}

std::string MemoryFilesystem::Key(const std::filesystem::path& path) {
  auto normal = path.lexically_normal().generic_string();
  while (normal.size() > 1 && normal.back() == '/') {
    normal.pop_back();
  }
  if (normal.empty() || normal.front() != '/') {
    normal.insert(normal.begin(), '/');
  }
  return normal;
}

std::string MemoryFilesystem::ParentKey(const std::string& key) {
  const auto pos = key.find_last_of('/');
  if (pos == 0 || pos == std::string::npos) {
    return "/";
  }
  return key.substr(0, pos);
}

std::string MemoryFilesystem::ChildPrefix(const std::string& key) {
  return key == "/" ? key : key + "/";
}

const MemoryFilesystem::Node* MemoryFilesystem::Find(const std::string& key) const {
  auto it = nodes_.find(key);
  return it == nodes_.end() ? nullptr : &it->second;
}

bool MemoryFilesystem::HasChildren(const std::string& key) const {
  const auto prefix = ChildPrefix(key);
  auto it = nodes_.upper_bound(prefix);
  if (key == "/") {
    return it != nodes_.end();
  }
  return it != nodes_.end() && it->first.compare(0, prefix.size(), prefix) == 0;
}

void MemoryFilesystem::RequireParentDirectory(const std::string& key, std::string_view operation,
                                              const std::filesystem::path& path) const {
  const auto* parent = Find(ParentKey(key));
  if (parent == nullptr) {
    throw MakeInjectedFault(ENOENT, operation, path);
  }
  if (!parent->is_directory) {
    throw MakeInjectedFault(ENOTDIR, operation, path);
  }
}

void MemoryFilesystem::WriteFile(const std::filesystem::path& path, std::string_view content) {
  const auto key = Key(path);
  MakeDirectories(ParentKey(key));
  auto data = std::make_shared<Buffer>(content.begin(), content.end());
  nodes_[key] = Node{false, std::move(data)};
}

void MemoryFilesystem::MakeDirectories(const std::filesystem::path& path) {
  const auto key = Key(path);
  std::string current;
  for (const auto& part : std::filesystem::path(key)) {
    if (part == "/") {
      continue;
    }
    current += "/" + part.string();
    auto it = nodes_.find(current);
    if (it == nodes_.end()) {
      nodes_.emplace(current, Node{true, nullptr});
    } else if (!it->second.is_directory) {
      throw MakeInjectedFault(ENOTDIR, "create", current);
    }
  }
}

std::optional<std::string> MemoryFilesystem::ReadFile(const std::filesystem::path& path) const {
  const auto* node = Find(Key(path));
  if (node == nullptr || node->is_directory) {
    return std::nullopt;
  }
  return std::string(node->data->begin(), node->data->end());
}

bool MemoryFilesystem::Exists(const std::filesystem::path& path) const {
  return Find(Key(path)) != nullptr;
}

bool MemoryFilesystem::IsDirectory(const std::filesystem::path& path) const {
  const auto* node = Find(Key(path));
  return node != nullptr && node->is_directory;
}

FileInfo MemoryFilesystem::Stat(const std::filesystem::path& path) {
  if (hooks_.before_stat) {
    hooks_.before_stat(path);
  }
  const auto* node = Find(Key(path));
  if (node == nullptr) {
    throw MakeInjectedFault(ENOENT, "stat", path);
  }
  FileInfo info;
  info.is_directory = node->is_directory;
  info.size = node->is_directory ? 0 : node->data->size();
  return info;
}

std::vector<std::string> MemoryFilesystem::ReadDir(const std::filesystem::path& path) {
  if (hooks_.before_read_dir) {
    hooks_.before_read_dir(path);
  }
  const auto key = Key(path);
  const auto* node = Find(key);
  if (node == nullptr) {
    throw MakeInjectedFault(ENOENT, "read directory", path);
  }
  if (!node->is_directory) {
    throw MakeInjectedFault(ENOTDIR, "read directory", path);
  }
  const auto prefix = ChildPrefix(key);
  std::vector<std::string> names;
  for (auto it = nodes_.upper_bound(prefix); it != nodes_.end(); ++it) {
    if (it->first.compare(0, prefix.size(), prefix) != 0) {
      break;
    }
    auto rest = it->first.substr(prefix.size());
    if (!rest.empty() && rest.find('/') == std::string::npos) {
      names.push_back(std::move(rest));
    }
  }
  std::sort(names.begin(), names.end());
  return names;
}

std::unique_ptr<InputFile> MemoryFilesystem::OpenRead(const std::filesystem::path& path) {
  if (hooks_.before_open) {
    hooks_.before_open(path);
  }
  const auto* node = Find(Key(path));
  if (node == nullptr) {
    throw MakeInjectedFault(ENOENT, "open", path);
  }
  if (node->is_directory) {
    throw MakeInjectedFault(EISDIR, "open", path);
  }
  return std::make_unique<MemoryInputFile>(*node->data, path);
}

std::unique_ptr<OutputFile> MemoryFilesystem::Create(const std::filesystem::path& path) {
  if (hooks_.before_create) {
    hooks_.before_create(path);
  }
  const auto key = Key(path);
  RequireParentDirectory(key, "open", path);
  const auto* existing = Find(key);
  if (existing != nullptr && existing->is_directory) {
    throw MakeInjectedFault(EISDIR, "open", path);
  }
  auto data = std::make_shared<Buffer>();
  nodes_[key] = Node{false, data};
  ++mutations_;
  return std::make_unique<MemoryOutputFile>(std::move(data), path, hooks_);
}

void MemoryFilesystem::Rename(const std::filesystem::path& from, const std::filesystem::path& to) {
  if (hooks_.before_rename) {
    hooks_.before_rename(from, to);
  }
  const auto from_key = Key(from);
  const auto to_key = Key(to);
  const auto* source = Find(from_key);
  if (source == nullptr) {
    throw MakeInjectedFault(ENOENT, "rename", from);
  }
  RequireParentDirectory(to_key, "rename", to);
  if (from_key == to_key) {
    return;
  }
  const auto* target = Find(to_key);
  if (target != nullptr) {
    if (target->is_directory && !source->is_directory) {
      throw MakeInjectedFault(EISDIR, "rename", to);
    }
    if (!target->is_directory && source->is_directory) {
      throw MakeInjectedFault(ENOTDIR, "rename", to);
    }
    if (target->is_directory && HasChildren(to_key)) {
      throw MakeInjectedFault(ENOTEMPTY, "rename", to);
    }
  }
  const bool source_is_directory = source->is_directory;
  const auto prefix = ChildPrefix(from_key);
  if (source_is_directory && to_key.compare(0, prefix.size(), prefix) == 0) {
    throw MakeInjectedFault(EINVAL, "rename", to);
  }

  std::vector<std::pair<std::string, Node>> moved;
  for (auto it = nodes_.begin(); it != nodes_.end();) {
    if (it->first == from_key) {
      moved.emplace_back(to_key, it->second);
      it = nodes_.erase(it);
    } else if (source_is_directory && it->first.compare(0, prefix.size(), prefix) == 0) {
      moved.emplace_back(ChildPrefix(to_key) + it->first.substr(prefix.size()), it->second);
      it = nodes_.erase(it);
    } else {
      ++it;
    }
  }
  for (auto& entry : moved) {
    nodes_[entry.first] = std::move(entry.second);
  }
  ++mutations_;
}

void MemoryFilesystem::Remove(const std::filesystem::path& path) {
  if (hooks_.before_remove) {
    hooks_.before_remove(path);
  }
  const auto key = Key(path);
  const auto* node = Find(key);
  if (node == nullptr) {
    throw MakeInjectedFault(ENOENT, "remove", path);
  }
  if (key == "/") {
    throw MakeInjectedFault(EBUSY, "remove", path);
  }
  if (node->is_directory && HasChildren(key)) {
    throw MakeInjectedFault(ENOTEMPTY, "remove", path);
  }
  nodes_.erase(key);
  ++mutations_;
}

void MemoryFilesystem::RemoveAll(const std::filesystem::path& path) {
  if (hooks_.before_remove) {
    hooks_.before_remove(path);
  }
  const auto key = Key(path);
  if (key == "/") {
    throw MakeInjectedFault(EBUSY, "remove", path);
  }
  const auto prefix = ChildPrefix(key);
  for (auto it = nodes_.begin(); it != nodes_.end();) {
    if (it->first == key || it->first.compare(0, prefix.size(), prefix) == 0) {
      it = nodes_.erase(it);
    } else {
      ++it;
    }
  }
  ++mutations_;
}

void MemoryFilesystem::Mkdir(const std::filesystem::path& path) {
  if (hooks_.before_mkdir) {
    hooks_.before_mkdir(path);
  }
  const auto key = Key(path);
  if (Find(key) != nullptr) {
    throw MakeInjectedFault(EEXIST, "create", path);
  }
  RequireParentDirectory(key, "create", path);
  nodes_.emplace(key, Node{true, nullptr});
  ++mutations_;
}

}  // namespace ms::fs
