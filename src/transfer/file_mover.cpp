#include "ms/transfer/file_mover.h"

#include "ms/common.h"
#include "ms/errors.h"
#include "ms/orchestrator/event_bus.h"

#include <exception>
#include <iostream>
#include <optional>
#include <utility>

namespace ms::transfer {
namespace {

using orchestrator::EventSeverity;
using orchestrator::PublishEvent;

// Removes the working file on scope exit unless the destination was
// committed. Leaves every artifact in place when the source vanished or its
// existence cannot be established.
class WorkingFileGuard {
public:
  // Holds references only; every argument must outlive the guard.
  WorkingFileGuard(fs::Filesystem& fs, const std::filesystem::path& source,
                   const std::filesystem::path& working, const std::string& op) noexcept
      : fs_(fs), source_(source), working_(working), op_(op) {}
  WorkingFileGuard(const WorkingFileGuard&) = delete;
  WorkingFileGuard& operator=(const WorkingFileGuard&) = delete;
  ~WorkingFileGuard() noexcept {
    if (committed_) {
      return;
    }
    try {
      Cleanup();
    } catch (const std::exception& cleanup_error) {
      // Event fields could not be built; the bus is unusable for this report.
      std::clog << "{\"event\":\"incomplete_file_not_removed\",\"path\":\""
                << working_.c_str() << "\",\"detail\":\"" << cleanup_error.what()
                << "\"}" << std::endl;
    }
  }

  void Commit() noexcept { committed_ = true; }

private:
  void Cleanup() {
    std::optional<fs::FileInfo> source_info;
    try {
      source_info = fs::StatIfExists(fs_, source_);
    } catch (const std::exception& stat_error) {
      PublishEvent(EventSeverity::kError, "stat_failed", "failed to stat",
           {{"op", op_}, {"path", PathToUtf8String(source_)}, {"error", stat_error.what()},
            {"error-type", "runtime"}});
      PublishEvent(EventSeverity::kWarning, "incomplete_file_not_removed", "incomplete file not removed",
           {{"op", op_}, {"path", PathToUtf8String(source_)}, {"reason", "src_existence_unknown"}});
      PublishEvent(EventSeverity::kWarning, "incomplete_file_not_removed", "incomplete file not removed",
           {{"op", op_}, {"path", PathToUtf8String(working_)}, {"reason", "src_existence_unknown"}});
      return;
    }

    if (!source_info) {
      PublishEvent(EventSeverity::kWarning, "file_not_found", "file not found",
           {{"op", op_}, {"path", PathToUtf8String(source_)}});
      PublishEvent(EventSeverity::kWarning, "incomplete_file_not_removed", "incomplete file not removed",
           {{"op", op_}, {"path", PathToUtf8String(working_)}, {"reason", "src_no_longer_exists"}});
      return;
    }

    try {
      fs_.Remove(working_);
      PublishEvent(EventSeverity::kInfo, "incomplete_file_removed", "incomplete file removed",
           {{"op", op_}, {"path", PathToUtf8String(working_)}});
    } catch (const Error& remove_error) {
      if (IsNotFound(remove_error)) {
        return;
      }
      PublishEvent(EventSeverity::kError, "incomplete_file_not_removed", "incomplete file not removed",
           {{"op", op_}, {"path", PathToUtf8String(working_)}, {"error", remove_error.what()},
            {"error-type", "runtime"}, {"reason", "error_occurred"}});
    } catch (const std::exception& remove_error) {
      PublishEvent(EventSeverity::kError, "incomplete_file_not_removed", "incomplete file not removed",
           {{"op", op_}, {"path", PathToUtf8String(working_)}, {"error", remove_error.what()},
            {"error-type", "runtime"}, {"reason", "error_occurred"}});
    }
  }

  fs::Filesystem& fs_;
  const std::filesystem::path& source_;
  const std::filesystem::path& working_;
  const std::string& op_;
  bool committed_{false};
};

} // namespace

std::filesystem::path WorkingFilePath(const std::filesystem::path& destination) {
  auto working = destination;
  working += std::string(kWorkingFileSuffix);
  return working;
}

const char* TransferMethodName(TransferMethod method) {
  switch (method) {
  case TransferMethod::kDirectRename:
    return "direct";
  case TransferMethod::kCopyAndRemove:
    return "c+r";
  }
  return "c+r";
}

FileMover::FileMover(fs::Filesystem& fs,
                     TransferOptions options,
                     const core::CancellationToken& token,
                     std::string op)
    : fs_(fs), options_(options), token_(token), op_(std::move(op)), cleanup_op_(op_ + "_cleanup") {}

TransferResult FileMover::Move(const std::filesystem::path& source,
                               const std::filesystem::path& destination,
                               const TransferHooks& hooks) {
  if (options_.direct) {
    try {
      fs_.Rename(source, destination);
      TransferResult result;
      result.method = TransferMethod::kDirectRename;
      return result;
    } catch (const Error& rename_error) {
      // Cross-device and similar failures fall back to copying.
      PublishEvent(EventSeverity::kDebug, "direct_rename_failed", "direct rename failed; copying instead",
           {{"op", op_}, {"src", PathToUtf8String(source)}, {"dst", PathToUtf8String(destination)},
            {"error", rename_error.what()}});
    }
  }
  return CopyAndRemove(source, destination, hooks);
}

TransferResult FileMover::CopyAndRemove(const std::filesystem::path& source,
                                        const std::filesystem::path& destination,
                                        const TransferHooks& hooks) {
  const auto working = WorkingFilePath(destination);
  TransferResult result;
  result.method = TransferMethod::kCopyAndRemove;

  auto in = fs_.OpenRead(source);
  auto out = fs_.Create(working);
  WorkingFileGuard guard(fs_, source, working, cleanup_op_);

  core::CopyResult copied;
  try {
    copied = core::CopyWithDigests(*in, *out, token_, hooks.after_read);
  } catch (const Error& io_error) {
    RethrowWithContext(io_error, "failed during io");
  }

  try {
    out->Sync();
  } catch (const Error& sync_error) {
    RethrowWithContext(sync_error, "failed during sync");
  }

  in->Close();
  try {
    out->Close();
  } catch (const Error& close_error) {
    RethrowWithContext(close_error, "failed to close: " + QuotePath(working));
  }

  result.bytes = copied.bytes;
  result.source_digest = crypto::DigestToHex(copied.source_digest);
  result.written_digest = crypto::DigestToHex(copied.written_digest);

  if (result.source_digest != result.written_digest) {
    throw Error{ErrorDomain::Integrity, errors::integrity::kMemoryHashMismatch,
                std::string(errors::msg::kMemoryHashMismatch) + ": \"" + result.source_digest +
                    "\" (srcHash) != \"" + result.written_digest + "\" (dstHash)"};
  }

  fs_.Rename(working, destination);
  guard.Commit();

  if (options_.verify) {
    auto verifier = fs_.OpenRead(destination);
    crypto::Sha256Digest verified{};
    try {
      verified = core::DigestStream(*verifier, token_);
    } catch (const Error& read_error) {
      RethrowWithContext(read_error,
                         "failed to re-read for --verify pass: " + QuotePath(destination));
    }
    verifier->Close();
    result.verify_digest = crypto::DigestToHex(verified);
    if (result.source_digest != result.verify_digest) {
      throw Error{ErrorDomain::Integrity, errors::integrity::kVerifyHashMismatch,
                  std::string(errors::msg::kVerifyHashMismatch) + ": \"" + result.source_digest +
                      "\" (srcHash) != \"" + result.verify_digest + "\" (verifyHash)"};
    }
  }

  try {
    fs_.Remove(source);
  } catch (const Error& remove_error) {
    RethrowWithContext(remove_error, "failed to remove (after move): " + QuotePath(source));
  }
  return result;
}

} // namespace ms::transfer
