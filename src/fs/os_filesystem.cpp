#include "ms/fs/os_filesystem.h"

#include "ms/common.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace ms::fs {
namespace {

constexpr mode_t kFileBasePerm = 0666;
constexpr mode_t kDirBasePerm = 0777;

ms::Retryability ClassifyNativeError(int native) {
  switch (native) {
#if defined(EINTR)
    case EINTR:
#endif
#if defined(EAGAIN)
    case EAGAIN:
#endif
#if defined(EWOULDBLOCK) && EWOULDBLOCK != EAGAIN
    case EWOULDBLOCK:
#endif
      return ms::Retryability::kRetryable;
#if defined(EBUSY)
    case EBUSY:
      return ms::Retryability::kTransient;
#endif
#if defined(ETIMEDOUT)
    case ETIMEDOUT:
      return ms::Retryability::kTransient;
#endif
    default:
      break;
  }
  return ms::Retryability::kFatal;
}

[[noreturn]] void ThrowIoError(int err, const std::string& operation,
                               const std::filesystem::path& path) {
  throw Error{ErrorDomain::IO,
              err,
              "failed to " + operation + ": " + QuotePath(path) + " (" + std::strerror(err) + ")",
              err,
              ClassifyNativeError(err)};
}

[[noreturn]] void ThrowSystemError(const std::system_error& sys_err, const std::string& operation,
                                   const std::filesystem::path& path) {
  const int err = sys_err.code().value();
  throw Error{ErrorDomain::IO,
              err,
              "failed to " + operation + ": " + QuotePath(path) + " (" + sys_err.code().message() + ")",
              err,
              ClassifyNativeError(err)};
}

bool IsTransientFsyncError(int err) {
  return err == EINTR || err == EAGAIN || err == EBUSY;
}

class FdInputFile : public InputFile {
public:
  FdInputFile(int fd, std::filesystem::path path) : fd_(fd), path_(std::move(path)) {}
  FdInputFile(const FdInputFile&) = delete;
  FdInputFile& operator=(const FdInputFile&) = delete;
  ~FdInputFile() override {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }

  std::size_t Read(std::span<std::uint8_t> buffer) override {
    if (fd_ < 0) {
      ThrowIoError(EBADF, "read", path_);
    }
    for (;;) {
      const ssize_t got = ::read(fd_, buffer.data(), buffer.size());
      if (got >= 0) {
        return static_cast<std::size_t>(got);
      }
      const int saved_errno = errno;
      if (saved_errno == EINTR) {
        continue;
      }
      ThrowIoError(saved_errno, "read", path_);
    }
  }

  void Close() override {
    if (fd_ < 0) {
      return;
    }
    const int fd = fd_;
    fd_ = -1;
    if (::close(fd) != 0) {
      ThrowIoError(errno, "close", path_);
    }
  }

private:
  int fd_;
  std::filesystem::path path_;
};

class FdOutputFile : public OutputFile {
public:
  FdOutputFile(int fd, std::filesystem::path path) : fd_(fd), path_(std::move(path)) {}
  FdOutputFile(const FdOutputFile&) = delete;
  FdOutputFile& operator=(const FdOutputFile&) = delete;
  ~FdOutputFile() override {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }

  void Write(std::span<const std::uint8_t> data) override {
    if (fd_ < 0) {
      ThrowIoError(EBADF, "write", path_);
    }
    std::size_t written = 0;
    while (written < data.size()) {
      const ssize_t chunk = ::write(fd_, data.data() + written, data.size() - written);
      if (chunk < 0) {
        const int saved_errno = errno;
        if (saved_errno == EINTR) {
          continue;
        }
        ThrowIoError(saved_errno, "write", path_);
      }
      if (chunk == 0) {
        throw Error{ErrorDomain::IO, errors::io::kShortWrite,
                    "failed to write: " + QuotePath(path_) + " (short write)"};
      }
      written += static_cast<std::size_t>(chunk);
    }
  }

  // fsync with a bounded back-off for transient failures.
  void Sync() override {
    if (fd_ < 0) {
      ThrowIoError(EBADF, "sync", path_);
    }
    constexpr int kMaxRetries = 4;
    std::chrono::milliseconds backoff{5};
    for (int attempt = 0;; ++attempt) {
      if (::fsync(fd_) == 0) {
        return;
      }
      const int saved_errno = errno;
      if (saved_errno == EINTR) {
        continue;
      }
      if (attempt >= kMaxRetries || !IsTransientFsyncError(saved_errno)) {
        ThrowIoError(saved_errno, "sync", path_);
      }
      std::this_thread::sleep_for(backoff);
      backoff *= 2;
    }
  }

  void Close() override {
    if (fd_ < 0) {
      return;
    }
    const int fd = fd_;
    fd_ = -1;
    if (::close(fd) != 0) {
      ThrowIoError(errno, "close", path_);
    }
  }

private:
  int fd_;
  std::filesystem::path path_;
};

}  // namespace

FileInfo OsFilesystem::Stat(const std::filesystem::path& path) {
  struct stat st {};
  if (::lstat(path.c_str(), &st) != 0) {
    ThrowIoError(errno, "stat", path);
  }
  FileInfo info;
  info.is_directory = S_ISDIR(st.st_mode);
  info.size = static_cast<std::uint64_t>(st.st_size);
  return info;
}

std::vector<std::string> OsFilesystem::ReadDir(const std::filesystem::path& path) {
  std::unique_ptr<DIR, decltype(&::closedir)> dir(::opendir(path.c_str()), &::closedir);
  if (!dir) {
    ThrowIoError(errno, "read directory", path);
  }
  std::vector<std::string> names;
  for (;;) {
    errno = 0;
    const dirent* entry = ::readdir(dir.get());
    if (entry == nullptr) {
      const int saved_errno = errno;
      if (saved_errno != 0) {
        ThrowIoError(saved_errno, "read directory", path);
      }
      break;
    }
    const std::string_view name = entry->d_name;
    if (name == "." || name == "..") {
      continue;
    }
    names.emplace_back(name);
  }
  std::sort(names.begin(), names.end());
  return names;
}

std::unique_ptr<InputFile> OsFilesystem::OpenRead(const std::filesystem::path& path) {
  const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    ThrowIoError(errno, "open", path);
  }
  return std::make_unique<FdInputFile>(fd, path);
}

std::unique_ptr<OutputFile> OsFilesystem::Create(const std::filesystem::path& path) {
  const int fd = ::open(path.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, kFileBasePerm);
  if (fd < 0) {
    ThrowIoError(errno, "open", path);
  }
  return std::make_unique<FdOutputFile>(fd, path);
}

void OsFilesystem::Rename(const std::filesystem::path& from, const std::filesystem::path& to) {
  if (::rename(from.c_str(), to.c_str()) != 0) {
    const int saved_errno = errno;
    throw Error{ErrorDomain::IO,
                saved_errno,
                "failed to rename: " + QuotePath(from) + " -x-> " + QuotePath(to) + " (" +
                    std::strerror(saved_errno) + ")",
                saved_errno,
                ClassifyNativeError(saved_errno)};
  }
}

void OsFilesystem::Remove(const std::filesystem::path& path) {
  if (::remove(path.c_str()) != 0) {
    ThrowIoError(errno, "remove", path);
  }
}

void OsFilesystem::RemoveAll(const std::filesystem::path& path) {
  try {
    std::filesystem::remove_all(path);
  } catch (const std::filesystem::filesystem_error& fs_err) {
    ThrowSystemError(fs_err, "remove", path);
  }
}

void OsFilesystem::Mkdir(const std::filesystem::path& path) {
  if (::mkdir(path.c_str(), kDirBasePerm) != 0) {
    ThrowIoError(errno, "create", path);
  }
}

}  // namespace ms::fs
