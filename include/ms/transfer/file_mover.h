#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "ms/core/cancellation.h"
#include "ms/core/stream_copier.h"
#include "ms/fs/filesystem.h"

namespace ms::transfer {

// Suffix of the in-flight copy next to its destination. Files carrying it are
// leftovers of an interrupted transfer and are overwritten by the next run.
inline constexpr std::string_view kWorkingFileSuffix = ".mirsht";

std::filesystem::path WorkingFilePath(const std::filesystem::path& destination);

struct TransferOptions {
  bool direct{false};  // try rename(2) before copying
  bool verify{false};  // re-read the committed destination
};

enum class TransferMethod { kDirectRename, kCopyAndRemove };

const char* TransferMethodName(TransferMethod method);

struct TransferResult {
  TransferMethod method{TransferMethod::kCopyAndRemove};
  std::uint64_t bytes{0};
  // Hex SHA-256 digests; empty for a direct rename. verify_digest stays empty
  // unless the verify pass ran.
  std::string source_digest;
  std::string written_digest;
  std::string verify_digest;
};

struct TransferHooks {
  core::ChunkHook after_read;
};

// Moves one file between two trees. On success the source is gone and the
// destination holds identical bytes. Any failure before the destination is
// committed removes the working file again, provided the source is still
// there. After the commit the destination is kept whatever happens.
class FileMover {
public:
  FileMover(fs::Filesystem& fs,
            TransferOptions options,
            const core::CancellationToken& token,
            std::string op = "move");

  TransferResult Move(const std::filesystem::path& source,
                      const std::filesystem::path& destination,
                      const TransferHooks& hooks = {});

private:
  TransferResult CopyAndRemove(const std::filesystem::path& source,
                               const std::filesystem::path& destination,
                               const TransferHooks& hooks);

  fs::Filesystem& fs_;
  TransferOptions options_;
  const core::CancellationToken& token_;
  std::string op_;
  std::string cleanup_op_;
};

} // namespace ms::transfer
