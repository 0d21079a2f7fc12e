#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

struct evp_md_ctx_st; // EVP_MD_CTX, kept out of the header

namespace lfly {

// Raw 32-byte SHA-256 digest (binary, not hex)
using digest = std::array<std::uint8_t, 32>;

/**
 * Incremental SHA-256. Feed bytes with update() as they stream past,
 * then call finish() once for the lowercase hex oid.
 */
class Sha256 {
public:
  Sha256();
  ~Sha256();

  Sha256(const Sha256 &) = delete;
  auto operator=(const Sha256 &) -> Sha256 & = delete;

  void update(std::span<const std::uint8_t> data);
  void update(std::string_view s) {
    update(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()),
                                         s.size()));
  }

  // Finalize and return the 64-char hex digest. The hasher cannot be reused.
  [[nodiscard]] auto finish() -> std::string;

private:
  evp_md_ctx_st *ctx_{nullptr};
  bool finished_{false};
};

/** SHA-256 of arbitrary bytes. */
digest sha256(std::span<const std::uint8_t> data);

// Convenience overload for string-like input (no copy).
inline digest sha256(std::string_view s) {
  return sha256(
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()), s.size()));
}

/** Convert binary digest to 64-char lowercase hex. */
std::string to_hex(const digest &id);

// Validate a 64-char lowercase hex oid (the only form used as a storage key)
auto looks_oid(std::string_view str) -> bool;

} // namespace lfly
