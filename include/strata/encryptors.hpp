#pragma once

#include <cstdint>
#include <memory>

#include "strata/buffer.hpp"
#include "strata/config.hpp"
#include "strata/descriptor.hpp"
#include "strata/error.hpp"

namespace strata::encryptors {

// An AEAD cipher with a 256-bit key, 96-bit nonce and 128-bit tag.
class Encryptor {
 public:
  virtual ~Encryptor() = default;

  [[nodiscard]] virtual method id() const = 0;

  // Appends ciphertext followed by the tag to `out`.
  virtual result<void> seal(bytes_view plain, bytes_view key, const nonce& iv, byte_vector& out) const = 0;

  // Writes plaintext to `out`, which must hold `ciphertext.size()` bytes and
  // may alias `ciphertext`.
  virtual result<void> open(bytes_view ciphertext,
                            bytes_view tag,
                            bytes_view key,
                            const nonce& iv,
                            std::uint8_t* out) const = 0;
};

std::unique_ptr<Encryptor> make_aes_gcm();
std::unique_ptr<Encryptor> make_chacha20();

// Draws a nonce from the OpenSSL CSPRNG.
result<nonce> random_nonce();

}  // namespace strata::encryptors
