#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>

#include "ms/core/cancellation.h"
#include "ms/crypto/sha256.h"
#include "ms/fs/filesystem.h"

namespace ms::core {

inline constexpr std::size_t kCopyChunkSize = 32 * 1024;

// Input stream that refuses to read once the token has been cancelled. The
// check happens before every read request, never during one.
class CancellableReader {
public:
  CancellableReader(fs::InputFile& in, const CancellationToken& token) noexcept
      : in_(in), token_(token) {}

  std::size_t Read(std::span<std::uint8_t> buffer);

private:
  fs::InputFile& in_;
  const CancellationToken& token_;
};

struct CopyResult {
  std::uint64_t bytes{0};
  crypto::Sha256Digest source_digest{};
  crypto::Sha256Digest written_digest{};
};

// Observes each chunk after it was hashed on the read side and before it is
// written out. Test seam for in-memory corruption.
using ChunkHook = std::function<void(std::span<std::uint8_t> chunk)>;

// Copies in to out chunk by chunk. The source digest covers bytes as read,
// the written digest covers bytes as handed to out, so the two differ only if
// the data changed in memory between the two points.
CopyResult CopyWithDigests(fs::InputFile& in,
                           fs::OutputFile& out,
                           const CancellationToken& token,
                           const ChunkHook& after_read = {});

// Digest of the remaining content of in, honouring cancellation per chunk.
crypto::Sha256Digest DigestStream(fs::InputFile& in, const CancellationToken& token);

} // namespace ms::core
