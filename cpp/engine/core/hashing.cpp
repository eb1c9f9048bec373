#include "engine/core/hashing.hpp"

#include "engine/core/error.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <system_error>
#include <utility>
#include <vector>

namespace sssl {

void Sha256::CtxDeleter::operator()(evp_md_ctx_st* ctx) const noexcept {
  EVP_MD_CTX_free(ctx);
}

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
  SSSL_ENSURE(ctx_ != nullptr, ErrorCode::kInternal, "EVP_MD_CTX_new failed");
  init();
}

Sha256::~Sha256() = default;

Sha256::Sha256(Sha256&&) noexcept = default;
Sha256& Sha256::operator=(Sha256&&) noexcept = default;

void Sha256::init() {
  SSSL_ENSURE(EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) == 1,
              ErrorCode::kInternal, "EVP_DigestInit_ex(sha256) failed");
}

void Sha256::update_bytes(const void* data, std::size_t n) {
  if (data == nullptr || n == 0) return;
  SSSL_ENSURE(EVP_DigestUpdate(ctx_.get(), data, n) == 1,
              ErrorCode::kInternal, "EVP_DigestUpdate failed");
}

Digest256 Sha256::finish() {
  Digest256 out{};
  unsigned int len = 0;
  SSSL_ENSURE(EVP_DigestFinal_ex(ctx_.get(), out.data(), &len) == 1,
              ErrorCode::kInternal, "EVP_DigestFinal_ex failed");
  SSSL_ENSURE(len == kDigestBytes, ErrorCode::kInternal, "unexpected SHA-256 digest length");
  init();
  return out;
}

std::string digest_to_hex(const Digest256& d) {
  static const char* kHex = "0123456789abcdef";
  std::string out;
  out.resize(d.size() * 2);
  for (std::size_t i = 0; i < d.size(); ++i) {
    out[2 * i]     = kHex[(d[i] >> 4) & 0xFu];
    out[2 * i + 1] = kHex[d[i] & 0xFu];
  }
  return out;
}

std::string sha256_hex(std::string_view data) {
  Sha256 h;
  h.update_string(data);
  return digest_to_hex(h.finish());
}

std::string sha256_file(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    SSSL_THROW(ErrorCode::kMissingArtifact, "file not found: " + path.generic_string());
  }

  std::ifstream f(path, std::ios::binary);
  SSSL_ENSURE(f.good(), ErrorCode::kIoError, "cannot open for hashing: " + path.generic_string());

  Sha256 h;
  std::vector<char> buf(kHashChunkBytes);
  while (f) {
    f.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    const std::streamsize got = f.gcount();
    if (got > 0) h.update_bytes(buf.data(), static_cast<std::size_t>(got));
  }
  SSSL_ENSURE(f.eof(), ErrorCode::kIoError, "read failed while hashing: " + path.generic_string());

  return digest_to_hex(h.finish());
}

}  // namespace sssl
