#include <strata/log.hpp>
#include <strata/pipeline.hpp>
#include <strata/tail.hpp>

#include <algorithm>

namespace strata {

namespace {

// Reads the descriptor a stage left at the end of its tail and checks that it
// names this stage and the backend configured for it.
result<descriptor> expect_descriptor(TailReader& tail, const any_method& configured) {
  const layer kind = layer_of(configured);
  auto found = tail.read_descriptor();
  if (!found) {
    STRATA_LOG_DEBUG("{} descriptor unreadable: {}", layer_name(kind), found.error().message);
    return tl::make_unexpected(at_stage(std::move(found.error()), stage_of(kind)));
  }
  if (found->kind() != kind) {
    STRATA_LOG_DEBUG("expected {} descriptor, found {}", layer_name(kind), layer_name(found->kind()));
    return make_error(stage_of(kind),
                      error_code::layer_mismatch,
                      layer_mismatch{kind, found->kind()},
                      "expected a {} descriptor, found {}",
                      layer_name(kind),
                      layer_name(found->kind()));
  }
  if (found->method() != configured) {
    const auto expected_code = method_code(configured);
    const auto found_code = method_code(found->method());
    STRATA_LOG_DEBUG("{} method mismatch: configured {}, stored {}", layer_name(kind), expected_code, found_code);
    return make_error(stage_of(kind),
                      error_code::method_mismatch,
                      method_mismatch{kind, expected_code, found_code},
                      "{} backend mismatch: configured method {}, value written with method {}",
                      layer_name(kind),
                      expected_code,
                      found_code);
  }
  return found;
}

}  // namespace

result<Buffer> Pipeline::compress(Buffer payload,
                                  const compression_config& cfg,
                                  std::optional<bytes_view> dictionary) const {
  if (!is_write(cfg.dir)) {
    return payload;
  }
  const auto& backend = backends_.compressor();
  auto out = backend.compress(payload.span(), cfg.level, dictionary);
  if (!out) {
    return tl::make_unexpected(at_stage(std::move(out.error()), stage::compression));
  }
  TailWriter(*out).write_descriptor(descriptor(backend.id(), cfg.dir));
  return Buffer(std::move(*out), payload.metadata());
}

result<Buffer> Pipeline::decompress(Buffer stored,
                                    const compression_config& cfg,
                                    std::optional<bytes_view> dictionary) const {
  if (!is_read(cfg.dir)) {
    return stored;
  }
  const auto& backend = backends_.compressor();
  TailReader tail(stored.span());
  if (auto desc = expect_descriptor(tail, backend.id()); !desc) {
    return tl::make_unexpected(std::move(desc.error()));
  }
  auto out = backend.decompress(tail, dictionary);
  if (!out) {
    return tl::make_unexpected(at_stage(std::move(out.error()), stage::compression));
  }
  return Buffer(std::move(*out), stored.metadata());
}

// Layout: [ciphertext][tag][nonce][descriptor].
result<Buffer> Pipeline::encrypt(Buffer payload, direction dir, const write_args& args) const {
  if (!is_write(dir)) {
    return payload;
  }
  nonce iv{};
  if (args.nonce_override) {
    iv = *args.nonce_override;
  } else {
    auto fresh = encryptors::random_nonce();
    if (!fresh) {
      return tl::make_unexpected(at_stage(std::move(fresh.error()), stage::encryption));
    }
    iv = *fresh;
  }

  const auto& backend = backends_.encryptor();
  byte_vector out;
  out.reserve(payload.size() + k_tag_size + k_nonce_size + descriptor::k_size);
  if (auto sealed = backend.seal(payload.span(), args.key, iv, out); !sealed) {
    return tl::make_unexpected(at_stage(std::move(sealed.error()), stage::encryption));
  }
  TailWriter tail(out);
  tail.write(iv);
  tail.write_descriptor(descriptor(backend.id(), dir));
  return Buffer(std::move(out), payload.metadata());
}

result<Buffer> Pipeline::decrypt(Buffer stored, direction dir, const read_args& args) const {
  if (!is_read(dir)) {
    return stored;
  }
  const auto& backend = backends_.encryptor();
  TailReader tail(stored.span());
  if (auto desc = expect_descriptor(tail, backend.id()); !desc) {
    return tl::make_unexpected(std::move(desc.error()));
  }
  auto iv_bytes = tail.read_array<k_nonce_size>();
  if (!iv_bytes) {
    return tl::make_unexpected(at_stage(std::move(iv_bytes.error()), stage::encryption));
  }
  auto tag_bytes = tail.read_array<k_tag_size>();
  if (!tag_bytes) {
    return tl::make_unexpected(at_stage(std::move(tag_bytes.error()), stage::encryption));
  }

  nonce iv{};
  std::copy(iv_bytes->begin(), iv_bytes->end(), iv.begin());
  std::array<std::uint8_t, k_tag_size> tag{};
  std::copy(tag_bytes->begin(), tag_bytes->end(), tag.begin());
  const std::size_t cipher_len = tail.size();
  const Metadata metadata = stored.metadata();

  // Owned buffers are decrypted in place; the ciphertext starts at offset 0.
  byte_vector out;
  if (stored.is_owned()) {
    out = std::move(stored).into_vec();
    const bytes_view ciphertext(out.data(), cipher_len);
    if (auto opened = backend.open(ciphertext, tag, args.key, iv, out.data()); !opened) {
      return tl::make_unexpected(at_stage(std::move(opened.error()), stage::encryption));
    }
    out.resize(cipher_len);
  } else {
    out.resize(cipher_len);
    if (auto opened = backend.open(tail.remaining(), tag, args.key, iv, out.data()); !opened) {
      return tl::make_unexpected(at_stage(std::move(opened.error()), stage::encryption));
    }
  }
  return Buffer(std::move(out), metadata);
}

result<Buffer> Pipeline::protect(Buffer payload, const correction_config& cfg) const {
  if (!is_write(cfg.dir)) {
    return payload;
  }
  const auto& backend = backends_.corrector();
  auto out = backend.protect(payload.span(), cfg.level);
  if (!out) {
    return tl::make_unexpected(at_stage(std::move(out.error()), stage::correction));
  }
  TailWriter(*out).write_descriptor(descriptor(backend.id(), cfg.dir));
  return Buffer(std::move(*out), payload.metadata());
}

result<Buffer> Pipeline::recover(Buffer stored, const correction_config& cfg) const {
  if (!is_read(cfg.dir)) {
    return stored;
  }
  const auto& backend = backends_.corrector();
  TailReader tail(stored.span());
  if (auto desc = expect_descriptor(tail, backend.id()); !desc) {
    return tl::make_unexpected(std::move(desc.error()));
  }
  auto out = backend.recover(std::move(stored), tail);
  if (!out) {
    return tl::make_unexpected(at_stage(std::move(out.error()), stage::correction));
  }
  return out;
}

result<Buffer> Pipeline::write_bytes(Buffer serialized, const type_config& cfg, const write_args& args) const {
  return compress(std::move(serialized), cfg.compression, args.dictionary)
      .and_then([&](Buffer compressed) { return encrypt(std::move(compressed), cfg.encryption, args); })
      .and_then([&](Buffer sealed) { return protect(std::move(sealed), cfg.correction); });
}

result<Buffer> Pipeline::read_bytes(Buffer stored, const type_config& cfg, const read_args& args) const {
  return recover(std::move(stored), cfg.correction)
      .and_then([&](Buffer recovered) { return decrypt(std::move(recovered), cfg.encryption, args); })
      .and_then([&](Buffer opened) { return decompress(std::move(opened), cfg.compression, args.dictionary); });
}

}  // namespace strata
