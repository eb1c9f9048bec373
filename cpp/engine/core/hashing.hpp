#pragma once
/*
================================================================================
Fragment 1.5 — Core: Content Digests (SHA-256)
FILE: cpp/engine/core/hashing.hpp

Purpose:
  - Content addressing for sealed artifact sets (MANIFEST.sha256).
  - Byte-level equality checks between replay directories.

Design constraints:
  - Files are streamed in fixed 1 MiB blocks so memory stays bounded.
  - Hex output is lowercase, 64 chars, identical to `sha256sum`.
  - Backend is OpenSSL EVP; the context is owned by Sha256 (RAII).
================================================================================
*/

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

struct evp_md_ctx_st;

namespace sssl {

inline constexpr std::size_t kDigestBytes = 32;
inline constexpr std::size_t kHashChunkBytes = 1024 * 1024;

using Digest256 = std::array<std::uint8_t, kDigestBytes>;

class Sha256 {
 public:
  Sha256();
  ~Sha256();

  Sha256(const Sha256&) = delete;
  Sha256& operator=(const Sha256&) = delete;
  Sha256(Sha256&&) noexcept;
  Sha256& operator=(Sha256&&) noexcept;

  void update_bytes(const void* data, std::size_t n);
  void update_string(std::string_view s) { update_bytes(s.data(), s.size()); }

  // Finalizes and resets; the object can be reused for a new digest.
  Digest256 finish();

 private:
  struct CtxDeleter {
    void operator()(evp_md_ctx_st* ctx) const noexcept;
  };

  void init();

  std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
};

std::string digest_to_hex(const Digest256& d);

std::string sha256_hex(std::string_view data);

// Streams the file in kHashChunkBytes blocks.
// Throws kMissingArtifact if absent, kIoError on read failure.
std::string sha256_file(const std::filesystem::path& path);

}  // namespace sssl
