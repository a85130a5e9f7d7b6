#pragma once
#include <array>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

struct evp_md_ctx_st;

namespace ms::crypto {

inline constexpr std::size_t kSha256DigestSize = 32;
using Sha256Digest = std::array<uint8_t, kSha256DigestSize>;

// Incremental SHA-256 over OpenSSL's EVP interface, for hashing a stream
// chunk by chunk while it is being copied.
class Sha256Hasher {
public:
  Sha256Hasher();
  ~Sha256Hasher();

  Sha256Hasher(const Sha256Hasher&) = delete;
  Sha256Hasher& operator=(const Sha256Hasher&) = delete;
  Sha256Hasher(Sha256Hasher&&) noexcept;
  Sha256Hasher& operator=(Sha256Hasher&&) noexcept;

  void Update(std::span<const uint8_t> data);
  // Finalizes the digest; the hasher cannot be updated afterwards.
  Sha256Digest Finish();

private:
  struct ContextDeleter {
    void operator()(evp_md_ctx_st* ctx) const noexcept;
  };

  std::unique_ptr<evp_md_ctx_st, ContextDeleter> ctx_;
  bool finished_{false};
};

Sha256Digest SHA256_Hash(std::span<const uint8_t> data);
Sha256Digest SHA256_Hash(const std::vector<uint8_t>& data);

std::string DigestToHex(const Sha256Digest& digest);

} // namespace ms::crypto
