#include "ms/core/stream_copier.h"
#include "ms/crypto/sha256.h"
#include "ms/fs/memory_filesystem.h"

#include <cassert>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace {

std::string Pattern(std::size_t size) {
  std::string data(size, '\0');
  for (std::size_t i = 0; i < size; ++i) {
    data[i] = static_cast<char>('a' + (i * 7) % 26);
  }
  return data;
}

std::vector<uint8_t> Bytes(const std::string& text) {
  return std::vector<uint8_t>(text.begin(), text.end());
}

void TestSha256() {
  using ms::crypto::DigestToHex;
  using ms::crypto::SHA256_Hash;

  assert(DigestToHex(SHA256_Hash(Bytes("abc"))) ==
         "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  assert(DigestToHex(SHA256_Hash(std::vector<uint8_t>{})) ==
         "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

  ms::crypto::Sha256Hasher hasher;
  const auto first = Bytes("a");
  const auto rest = Bytes("bc");
  hasher.Update(first);
  hasher.Update(rest);
  assert(hasher.Finish() == SHA256_Hash(Bytes("abc")));
}

void TestCopyComputesMatchingDigests() {
  ms::fs::MemoryFilesystem fs;
  const auto content = Pattern(3 * ms::core::kCopyChunkSize + 123);
  fs.WriteFile("/src/file.bin", content);

  ms::core::CancellationToken token;
  auto in = fs.OpenRead("/src/file.bin");
  auto out = fs.Create("/src/copy.bin");
  std::size_t chunks = 0;
  const auto result = ms::core::CopyWithDigests(*in, *out, token,
                                                [&](std::span<uint8_t>) { ++chunks; });
  out->Close();

  assert(result.bytes == content.size());
  assert(chunks == 4);
  assert(result.source_digest == result.written_digest);
  assert(result.source_digest == ms::crypto::SHA256_Hash(Bytes(content)));
  assert(fs.ReadFile("/src/copy.bin") == content);

  auto again = fs.OpenRead("/src/copy.bin");
  assert(ms::core::DigestStream(*again, token) == result.source_digest);
}

void TestCancelledBeforeFirstRead() {
  ms::fs::MemoryFilesystem fs;
  fs.WriteFile("/src/file.bin", "content");

  ms::core::CancellationToken token;
  token.Cancel();
  auto in = fs.OpenRead("/src/file.bin");
  auto out = fs.Create("/src/copy.bin");
  bool cancelled = false;
  try {
    ms::core::CopyWithDigests(*in, *out, token);
  } catch (const ms::CancelledError& err) {
    cancelled = err.domain == ms::ErrorDomain::Cancelled;
  }
  assert(cancelled);
  assert(fs.ReadFile("/src/copy.bin")->empty());
}

void TestCancelledBetweenChunks() {
  ms::fs::MemoryFilesystem fs;
  fs.WriteFile("/src/file.bin", Pattern(5 * ms::core::kCopyChunkSize));

  ms::core::CancellationToken token;
  auto in = fs.OpenRead("/src/file.bin");
  auto out = fs.Create("/src/copy.bin");
  bool cancelled = false;
  try {
    ms::core::CopyWithDigests(*in, *out, token, [&](std::span<uint8_t>) { token.Cancel(); });
  } catch (const ms::CancelledError&) {
    cancelled = true;
  }
  assert(cancelled);
  assert(fs.ReadFile("/src/copy.bin")->size() == ms::core::kCopyChunkSize);
}

void TestInMemoryCorruptionIsVisible() {
  ms::fs::MemoryFilesystem fs;
  fs.WriteFile("/src/file.bin", "content");

  ms::core::CancellationToken token;
  auto in = fs.OpenRead("/src/file.bin");
  auto out = fs.Create("/src/copy.bin");
  const auto result = ms::core::CopyWithDigests(*in, *out, token, [](std::span<uint8_t> chunk) {
    chunk[0] ^= 0xFF;
  });
  assert(result.source_digest != result.written_digest);
  assert(result.source_digest == ms::crypto::SHA256_Hash(Bytes("content")));
}

}  // namespace

int main() {
  TestSha256();
  TestCopyComputesMatchingDigests();
  TestCancelledBeforeFirstRead();
  TestCancelledBetweenChunks();
  TestInMemoryCorruptionIsVisible();
  return 0;
}
