#pragma once
#include <cerrno>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace ms {
  enum class ErrorDomain : std::uint16_t {
    IO = 0x02,
    Integrity = 0x03,
    Config = 0x05,
    State = 0x07,
    Cancelled = 0x08,
    Internal = 0x7F
  };

  // Each domain reserves 0x100 codes above its base so framework codes never
  // collide with propagated errno values, which travel in native_code.

  inline constexpr int ErrorDomainBase(ErrorDomain domain) {
    switch (domain) {
    case ErrorDomain::IO:
      return 0x0200;
    case ErrorDomain::Integrity:
      return 0x0300;
    case ErrorDomain::Config:
      return 0x0500;
    case ErrorDomain::State:
      return 0x0700;
    case ErrorDomain::Cancelled:
      return 0x0800;
    case ErrorDomain::Internal:
      return 0x7F00;
    }
    return 0;
  }

  enum class Retryability : std::uint8_t {
    kFatal = 0,
    kTransient,
    kRetryable
  };

  namespace errors {
    inline constexpr int Make(ErrorDomain domain, int offset) {
      return ErrorDomainBase(domain) + offset;
    }

    namespace io {
      inline constexpr int kMirrorMissing = Make(ErrorDomain::IO, 0x01);
      inline constexpr int kTargetMissing = Make(ErrorDomain::IO, 0x02);
      inline constexpr int kMirrorParentMissing = Make(ErrorDomain::IO, 0x03);
      inline constexpr int kMirrorParentNotDirectory = Make(ErrorDomain::IO, 0x04);
      inline constexpr int kShortWrite = Make(ErrorDomain::IO, 0x05);
    } // namespace io

    namespace integrity {
      inline constexpr int kMemoryHashMismatch = Make(ErrorDomain::Integrity, 0x01);
      inline constexpr int kVerifyHashMismatch = Make(ErrorDomain::Integrity, 0x02);
      inline constexpr int kDigestFailure = Make(ErrorDomain::Integrity, 0x03);
    } // namespace integrity

    namespace config {
      inline constexpr int kConfigMissing = Make(ErrorDomain::Config, 0x01);
      inline constexpr int kConfigMalformed = Make(ErrorDomain::Config, 0x02);
      inline constexpr int kModeInvalid = Make(ErrorDomain::Config, 0x03);
      inline constexpr int kRootsMissing = Make(ErrorDomain::Config, 0x04);
      inline constexpr int kRootsNotAbsolute = Make(ErrorDomain::Config, 0x05);
      inline constexpr int kRootsSame = Make(ErrorDomain::Config, 0x06);
      inline constexpr int kExcludeNotAbsolute = Make(ErrorDomain::Config, 0x07);
      inline constexpr int kLogLevelInvalid = Make(ErrorDomain::Config, 0x08);
      inline constexpr int kUnknownArgument = Make(ErrorDomain::Config, 0x09);
      inline constexpr int kArgumentValueInvalid = Make(ErrorDomain::Config, 0x0A);
    } // namespace config

    namespace state {
      inline constexpr int kMirrorNotEmpty = Make(ErrorDomain::State, 0x01);
    } // namespace state

    namespace cancelled {
      inline constexpr int kOperationCancelled = Make(ErrorDomain::Cancelled, 0x01);
    } // namespace cancelled

  } // namespace errors

  struct Error : public std::runtime_error {
    ErrorDomain domain;
    int code;
    std::optional<int> native_code;
    Retryability retryability{Retryability::kFatal};
    std::vector<std::string> context;
    explicit Error(ErrorDomain d, int c, std::string msg,
                   std::optional<int> native = std::nullopt,
                   Retryability retry = Retryability::kFatal,
                   std::vector<std::string> ctx = {})
        : std::runtime_error(std::move(msg)),
          domain(d),
          code(c),
          native_code(native),
          retryability(retry),
          context(std::move(ctx)) {}
  };

  // Raised when the caller's cancellation token fires. Never absorbed by the
  // failure-tolerant policy.
  struct CancelledError : public Error {
    explicit CancelledError(std::string msg)
        : Error(ErrorDomain::Cancelled, errors::cancelled::kOperationCancelled, std::move(msg)) {}
  };

  inline bool IsNotFound(const Error& err) noexcept {
    return err.domain == ErrorDomain::IO && err.native_code.has_value() &&
           *err.native_code == ENOENT;
  }

  // Copy of err with an outer description prepended to its message.
  inline Error WithContext(const Error& err, const std::string& description) {
    auto ctx = err.context;
    ctx.push_back(description);
    return Error{err.domain, err.code, description + " (" + err.what() + ")", err.native_code,
                 err.retryability, std::move(ctx)};
  }

  // Re-raises err with an outer description prepended, keeping its identity.
  [[noreturn]] inline void RethrowWithContext(const Error& err, const std::string& description) {
    if (err.domain == ErrorDomain::Cancelled) {
      throw CancelledError(description + " (" + err.what() + ")");
    }
    throw WithContext(err, description);
  }
} // namespace ms
