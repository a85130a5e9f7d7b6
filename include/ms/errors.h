#pragma once

#include <string_view>

namespace ms::errors::msg {
inline constexpr std::string_view kConfigMalformed{"--config yaml file is malformed"};
inline constexpr std::string_view kConfigMissing{"--config yaml file does not exist"};
inline constexpr std::string_view kExcludePathNotAbsolute{"--exclude paths must all be absolute"};
inline constexpr std::string_view kMirrorTargetNotAbsolute{"--mirror and --target paths must all be absolute"};
inline constexpr std::string_view kMirrorTargetSame{"--mirror and --target paths cannot be the same"};
inline constexpr std::string_view kMissingMirrorTarget{"--mirror and --target paths must both be set"};
inline constexpr std::string_view kModeMismatch{"--mode must either be 'init' or 'move'"};
inline constexpr std::string_view kInvalidLogLevel{"--log-level has a not recognized value"};
inline constexpr std::string_view kUnknownArgument{"unknown command-line argument"};
inline constexpr std::string_view kInvalidArgumentValue{"invalid value for command-line argument"};

inline constexpr std::string_view kMemoryHashMismatch{"in-memory hash mismatch; possible corruption during in-memory I/O"};
inline constexpr std::string_view kVerifyHashMismatch{"--verify pass hash mismatch; possible corruption during disk-write I/O"};
inline constexpr std::string_view kMirrorNotEmpty{"--mirror contains files; run with --mode=move to relocate them, or remove the files manually"};
inline constexpr std::string_view kMirrorNotExist{"--mirror does not exist; have nowhere to move from"};
inline constexpr std::string_view kTargetNotExist{"--target does not exist; have nowhere to mirror from or move to"};
inline constexpr std::string_view kMirrorParentNotExist{"--mirror parent does not exist; cannot create mirror inside it"};
inline constexpr std::string_view kMirrorParentNotDir{"--mirror parent is not a directory; cannot create mirror inside it"};
inline constexpr std::string_view kOperationCancelled{"operation cancelled"};
}  // namespace ms::errors::msg
