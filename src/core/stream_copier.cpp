#include "ms/core/stream_copier.h"

#include <vector>

namespace ms::core {

std::size_t CancellableReader::Read(std::span<std::uint8_t> buffer) {
  token_.ThrowIfCancelled("copy interrupted");
  return in_.Read(buffer);
}

CopyResult CopyWithDigests(fs::InputFile& in,
                           fs::OutputFile& out,
                           const CancellationToken& token,
                           const ChunkHook& after_read) {
  CopyResult result;
  crypto::Sha256Hasher source_hasher;
  crypto::Sha256Hasher written_hasher;
  CancellableReader reader(in, token);
  std::vector<std::uint8_t> buffer(kCopyChunkSize);

  while (true) {
    const auto count = reader.Read(std::span<std::uint8_t>(buffer.data(), buffer.size()));
    if (count == 0) {
      break;
    }
    std::span<std::uint8_t> chunk(buffer.data(), count);
    source_hasher.Update(chunk);
    if (after_read) {
      after_read(chunk);
    }
    out.Write(chunk);
    written_hasher.Update(chunk);
    result.bytes += count;
  }

  result.source_digest = source_hasher.Finish();
  result.written_digest = written_hasher.Finish();
  return result;
}

crypto::Sha256Digest DigestStream(fs::InputFile& in, const CancellationToken& token) {
  crypto::Sha256Hasher hasher;
  CancellableReader reader(in, token);
  std::vector<std::uint8_t> buffer(kCopyChunkSize);
  while (true) {
    const auto count = reader.Read(std::span<std::uint8_t>(buffer.data(), buffer.size()));
    if (count == 0) {
      break;
    }
    hasher.Update(std::span<const std::uint8_t>(buffer.data(), count));
  }
  return hasher.Finish();
}

} // namespace ms::core
