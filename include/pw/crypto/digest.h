#pragma once

#include <cstdint>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

struct evp_md_ctx_st;

namespace pw::crypto {

enum class HashAlgorithm : std::uint8_t { kSha256 = 0, kSha384, kSha512 };

std::string_view ToString(HashAlgorithm algorithm) noexcept;
// Accepts "SHA-256", "SHA256", "sha256" and the 384/512 variants.
HashAlgorithm ParseHashAlgorithm(std::string_view name);

// Incremental digest over an OpenSSL EVP_MD_CTX; used where the input is a
// whole file tree that should not be concatenated in memory.
class Digest {
public:
  explicit Digest(HashAlgorithm algorithm);
  ~Digest();
  Digest(const Digest&) = delete;
  Digest& operator=(const Digest&) = delete;
  Digest(Digest&&) noexcept;
  Digest& operator=(Digest&&) noexcept;

  void Update(std::span<const std::uint8_t> data);
  void Update(std::string_view text);
  std::vector<std::uint8_t> Final();

  HashAlgorithm algorithm() const noexcept { return algorithm_; }

private:
  struct CtxDeleter {
    void operator()(evp_md_ctx_st* ctx) const noexcept;
  };
  HashAlgorithm algorithm_;
  std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
  bool finalized_{false};
};

}  // namespace pw::crypto
