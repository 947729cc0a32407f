#include <strata/encryptors.hpp>

#include <limits>
#include <memory>

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace strata::encryptors {

namespace {

struct cipher_ctx_deleter {
  void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};

using cipher_ctx = std::unique_ptr<EVP_CIPHER_CTX, cipher_ctx_deleter>;

constexpr std::size_t k_max_message_bytes = static_cast<std::size_t>(std::numeric_limits<int>::max());

std::string openssl_reason() {
  const unsigned long code = ERR_get_error();
  if (code == 0) {
    return "no OpenSSL error queued";
  }
  char text[256] = {};
  ERR_error_string_n(code, text, sizeof(text));
  ERR_clear_error();
  return text;
}

result<void> check_key(bytes_view key) {
  if (key.size() != k_key_size) {
    return make_error(stage::encryption,
                      error_code::invalid_key,
                      "key must be {} bytes, got {}",
                      k_key_size,
                      key.size());
  }
  return {};
}

// AES-256-GCM and ChaCha20-Poly1305 share the EVP AEAD interface; they differ
// only in the EVP_CIPHER.
class EvpAead final : public Encryptor {
 public:
  using cipher_fn = const EVP_CIPHER* (*)();

  EvpAead(method id, cipher_fn cipher) : id_(id), cipher_(cipher) {}

  [[nodiscard]] method id() const override { return id_; }

  result<void> seal(bytes_view plain, bytes_view key, const nonce& iv, byte_vector& out) const override {
    if (auto ok = check_key(key); !ok) {
      return ok;
    }
    if (plain.size() > k_max_message_bytes) {
      return make_error(stage::encryption, error_code::encrypt_failed, "message of {} bytes too large", plain.size());
    }

    cipher_ctx ctx(EVP_CIPHER_CTX_new());
    if (!ctx || EVP_EncryptInit_ex(ctx.get(), cipher_(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(iv.size()), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv.data()) != 1) {
      return make_error(stage::encryption, error_code::encrypt_failed, "cipher setup failed: {}", openssl_reason());
    }

    const std::size_t offset = out.size();
    out.resize(offset + plain.size() + k_tag_size);
    std::uint8_t* dst = out.data() + offset;

    int len = 0;
    if (!plain.empty() && EVP_EncryptUpdate(ctx.get(), dst, &len, plain.data(), static_cast<int>(plain.size())) != 1) {
      out.resize(offset);
      return make_error(stage::encryption, error_code::encrypt_failed, "encrypt failed: {}", openssl_reason());
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), dst + len, &final_len) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(),
                            EVP_CTRL_AEAD_GET_TAG,
                            static_cast<int>(k_tag_size),
                            dst + plain.size()) != 1) {
      out.resize(offset);
      return make_error(stage::encryption, error_code::encrypt_failed, "finalize failed: {}", openssl_reason());
    }
    return {};
  }

  result<void> open(bytes_view ciphertext,
                    bytes_view tag,
                    bytes_view key,
                    const nonce& iv,
                    std::uint8_t* out) const override {
    if (auto ok = check_key(key); !ok) {
      return ok;
    }
    if (tag.size() != k_tag_size || ciphertext.size() > k_max_message_bytes) {
      return make_error(stage::encryption, error_code::decrypt_failed, "malformed sealed payload");
    }

    cipher_ctx ctx(EVP_CIPHER_CTX_new());
    if (!ctx || EVP_DecryptInit_ex(ctx.get(), cipher_(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(iv.size()), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv.data()) != 1) {
      return make_error(stage::encryption, error_code::decrypt_failed, "cipher setup failed: {}", openssl_reason());
    }

    int len = 0;
    if (!ciphertext.empty() &&
        EVP_DecryptUpdate(ctx.get(), out, &len, ciphertext.data(), static_cast<int>(ciphertext.size())) != 1) {
      return make_error(stage::encryption, error_code::decrypt_failed, "decrypt failed: {}", openssl_reason());
    }
    // EVP takes the expected tag through a non-const pointer but only reads it.
    if (EVP_CIPHER_CTX_ctrl(ctx.get(),
                            EVP_CTRL_AEAD_SET_TAG,
                            static_cast<int>(tag.size()),
                            const_cast<std::uint8_t*>(tag.data())) != 1) {
      return make_error(stage::encryption, error_code::decrypt_failed, "tag rejected: {}", openssl_reason());
    }
    std::uint8_t final_block[16] = {};
    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), final_block, &final_len) != 1) {
      ERR_clear_error();
      return make_error(stage::encryption,
                        error_code::decrypt_failed,
                        "authentication failed: wrong key or corrupted ciphertext");
    }
    return {};
  }

 private:
  method id_;
  cipher_fn cipher_;
};

}  // namespace

std::unique_ptr<Encryptor> make_aes_gcm() { return std::make_unique<EvpAead>(method::aes_gcm, &EVP_aes_256_gcm); }

std::unique_ptr<Encryptor> make_chacha20() {
  return std::make_unique<EvpAead>(method::chacha20, &EVP_chacha20_poly1305);
}

result<nonce> random_nonce() {
  nonce iv{};
  if (RAND_bytes(iv.data(), static_cast<int>(iv.size())) != 1) {
    return make_error(stage::encryption, error_code::encrypt_failed, "RAND_bytes failed: {}", openssl_reason());
  }
  return iv;
}

}  // namespace strata::encryptors
