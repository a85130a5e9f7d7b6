#include "ms/crypto/sha256.h"

#include <openssl/err.h>
#include <openssl/evp.h>

#include <string>

#include "ms/common.h"
#include "ms/error.h"

namespace ms::crypto {

namespace {

[[noreturn]] void ThrowDigestError(const char* context) {
  unsigned long err = ERR_get_error();
  std::string message(context);
  if (err == 0) {
    message.append(": unknown OpenSSL error");
  } else {
    char buf[256] = {0};
    ERR_error_string_n(err, buf, sizeof(buf));
    message.append(": ");
    message.append(buf);
  }
  throw Error{ErrorDomain::Integrity, errors::integrity::kDigestFailure, std::move(message)};
}

}  // namespace

void Sha256Hasher::ContextDeleter::operator()(evp_md_ctx_st* ctx) const noexcept {
  EVP_MD_CTX_free(ctx);
}

Sha256Hasher::Sha256Hasher() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) {
    ThrowDigestError("EVP_MD_CTX_new");
  }
  if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
    ThrowDigestError("EVP_DigestInit_ex(EVP_sha256)");
  }
}

Sha256Hasher::~Sha256Hasher() = default;
Sha256Hasher::Sha256Hasher(Sha256Hasher&&) noexcept = default;
Sha256Hasher& Sha256Hasher::operator=(Sha256Hasher&&) noexcept = default;

void Sha256Hasher::Update(std::span<const uint8_t> data) {
  if (finished_) {
    throw Error{ErrorDomain::Internal, 0, "SHA-256 hasher updated after Finish"};
  }
  if (data.empty()) {
    return;
  }
  if (EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1) {
    ThrowDigestError("EVP_DigestUpdate");
  }
}

Sha256Digest Sha256Hasher::Finish() {
  if (finished_) {
    throw Error{ErrorDomain::Internal, 0, "SHA-256 hasher finished twice"};
  }
  Sha256Digest out{};
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx_.get(), out.data(), &len) != 1) {
    ThrowDigestError("EVP_DigestFinal_ex");
  }
  finished_ = true;
  if (len != out.size()) {
    throw Error{ErrorDomain::Integrity, errors::integrity::kDigestFailure,
                "Unexpected SHA-256 length", static_cast<int>(len)};
  }
  return out;
}

Sha256Digest SHA256_Hash(std::span<const uint8_t> data) {
  Sha256Digest out{};
  unsigned int len = 0;
  if (EVP_Digest(data.data(), data.size(), out.data(), &len, EVP_sha256(), nullptr) != 1) {
    ThrowDigestError("EVP_Digest(EVP_sha256)");
  }
  if (len != out.size()) {
    throw Error{ErrorDomain::Integrity, errors::integrity::kDigestFailure,
                "Unexpected SHA-256 length", static_cast<int>(len)};
  }
  return out;
}

Sha256Digest SHA256_Hash(const std::vector<uint8_t>& data) {
  return SHA256_Hash(std::span<const uint8_t>(data.data(), data.size()));
}

std::string DigestToHex(const Sha256Digest& digest) {
  return ms::HexEncode(std::span<const uint8_t>(digest.data(), digest.size()));
}

}  // namespace ms::crypto
