#include "tests/support/fixtures.hpp"

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <string>
#include <vector>

namespace {

std::vector<std::uint8_t> text_bytes(const std::string& s) { return std::vector<std::uint8_t>(s.begin(), s.end()); }

std::vector<std::uint8_t> repetitive_payload(std::size_t n) {
  std::vector<std::uint8_t> out;
  const std::string line = "sensor=7 status=nominal temperature=21.5 humidity=40;";
  while (out.size() < n) {
    out.insert(out.end(), line.begin(), line.end());
  }
  out.resize(n);
  return out;
}

bool same_bytes(strata::bytes_view a, strata::bytes_view b) { return std::equal(a.begin(), a.end(), b.begin(), b.end()); }

void check_compressor(const strata::Pipeline& pipeline, strata::compressors::method expected) {
  const auto payload = repetitive_payload(4096);
  const strata::compression_config both{strata::direction::both, strata::compressors::preset::maximum};

  auto compressed = pipeline.compress(strata::Buffer::borrowed(payload), both, std::nullopt);
  assert(compressed.has_value());
  assert(compressed->size() < payload.size());

  strata::TailReader tail(compressed->span());
  const auto desc = tail.read_descriptor();
  assert(desc.has_value());
  assert(desc->kind() == strata::layer::compression);
  assert(desc->method() == strata::any_method(expected));
  assert(desc->dir() == strata::direction::both);

  auto restored = pipeline.decompress(std::move(*compressed), both, std::nullopt);
  assert(restored.has_value());
  assert(same_bytes(restored->span(), payload));

  for (const auto lvl : {strata::compressors::level(strata::compressors::preset::minimum),
                         strata::compressors::level(strata::compressors::exact_level{5})}) {
    const strata::compression_config cfg{strata::direction::both, lvl};
    auto again = pipeline.compress(strata::Buffer::borrowed(payload), cfg, std::nullopt);
    assert(again.has_value());
    assert(same_bytes(pipeline.decompress(std::move(*again), cfg, std::nullopt)->span(), payload));
  }

  // Empty payloads survive too.
  const std::vector<std::uint8_t> empty;
  auto tiny = pipeline.compress(strata::Buffer::borrowed(empty), both, std::nullopt);
  assert(tiny.has_value());
  auto tiny_back = pipeline.decompress(std::move(*tiny), both, std::nullopt);
  assert(tiny_back.has_value());
  assert(tiny_back->empty());
}

void check_dictionary(const strata::Pipeline& pipeline) {
  const auto dictionary = repetitive_payload(2048);
  const auto other_dictionary = text_bytes(std::string(2048, 'q'));
  const auto payload = repetitive_payload(300);
  const strata::compression_config both{strata::direction::both, strata::compressors::preset::medium};

  auto compressed = pipeline.compress(strata::Buffer::borrowed(payload), both, strata::bytes_view(dictionary));
  assert(compressed.has_value());

  auto with_dict = pipeline.decompress(compressed->to_owned(), both, strata::bytes_view(dictionary));
  assert(with_dict.has_value());
  assert(same_bytes(with_dict->span(), payload));

  auto without = pipeline.decompress(compressed->to_owned(), both, std::nullopt);
  assert(!without.has_value());
  assert(without.error().where == strata::stage::compression);
  assert(without.error().code == strata::error_code::decompress_failed);

  auto wrong = pipeline.decompress(compressed->to_owned(), both, strata::bytes_view(other_dictionary));
  assert(!wrong.has_value());
  assert(wrong.error().code == strata::error_code::decompress_failed);
}

void check_encryptor(const strata::Pipeline& pipeline, strata::encryptors::method expected) {
  const auto key = fixtures::test_key();
  const auto other_key = fixtures::test_key(0x17);
  const auto payload = text_bytes("the quarterly numbers, unredacted");

  strata::write_args wargs;
  wargs.key = key;
  auto sealed = pipeline.encrypt(strata::Buffer::borrowed(payload), strata::direction::both, wargs);
  assert(sealed.has_value());
  assert(sealed->size() == payload.size() + strata::k_tag_size + strata::k_nonce_size + 2);

  strata::TailReader tail(sealed->span());
  const auto desc = tail.read_descriptor();
  assert(desc.has_value());
  assert(desc->method() == strata::any_method(expected));

  // Borrowed input: decrypted into a fresh allocation, input untouched.
  const std::vector<std::uint8_t> stored(sealed->span().begin(), sealed->span().end());
  auto opened = pipeline.decrypt(strata::Buffer::borrowed(stored), strata::direction::both, {key, std::nullopt});
  assert(opened.has_value());
  assert(opened->is_owned());
  assert(same_bytes(opened->span(), payload));
  assert(same_bytes(stored, sealed->span()));

  // Owned input: decrypted in place.
  std::vector<std::uint8_t> owned_copy = stored;
  const std::uint8_t* heap = owned_copy.data();
  auto in_place = pipeline.decrypt(strata::Buffer::owned(std::move(owned_copy)), strata::direction::both, {key, {}});
  assert(in_place.has_value());
  assert(in_place->span().data() == heap);
  assert(same_bytes(in_place->span(), payload));

  auto wrong_key = pipeline.decrypt(strata::Buffer::borrowed(stored), strata::direction::both, {other_key, {}});
  assert(!wrong_key.has_value());
  assert(wrong_key.error().where == strata::stage::encryption);
  assert(wrong_key.error().code == strata::error_code::decrypt_failed);

  std::vector<std::uint8_t> tampered = stored;
  tampered[3] ^= 0x01;
  auto corrupted = pipeline.decrypt(strata::Buffer::borrowed(tampered), strata::direction::both, {key, {}});
  assert(!corrupted.has_value());
  assert(corrupted.error().code == strata::error_code::decrypt_failed);

  // A fresh nonce per write; a caller nonce makes the output deterministic.
  auto again = pipeline.encrypt(strata::Buffer::borrowed(payload), strata::direction::both, wargs);
  assert(!same_bytes(again->span(), stored));
  strata::write_args fixed = wargs;
  fixed.nonce_override = strata::nonce{1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12};
  auto first = pipeline.encrypt(strata::Buffer::borrowed(payload), strata::direction::both, fixed);
  auto second = pipeline.encrypt(strata::Buffer::borrowed(payload), strata::direction::both, fixed);
  assert(same_bytes(first->span(), second->span()));

  const std::vector<std::uint8_t> short_key(16, 1);
  strata::write_args bad_key;
  bad_key.key = short_key;
  auto rejected = pipeline.encrypt(strata::Buffer::borrowed(payload), strata::direction::both, bad_key);
  assert(!rejected.has_value());
  assert(rejected.error().code == strata::error_code::invalid_key);
}

}  // namespace

int main() {
  const auto zstd = fixtures::pipeline_for({"bitsery", "zstd", "aes-gcm", "reed-solomon"});
  const auto zlib = fixtures::pipeline_for({"bitsery", "zlib", "chacha20", "reed-solomon"});

  check_compressor(zstd, strata::compressors::method::zstd);
  check_compressor(zlib, strata::compressors::method::zlib);
  check_dictionary(zstd);
  check_dictionary(zlib);
  check_encryptor(zstd, strata::encryptors::method::aes_gcm);
  check_encryptor(zlib, strata::encryptors::method::chacha20);

  const auto payload = repetitive_payload(512);
  const auto key = fixtures::test_key();

  {
    // A stage whose direction excludes the operation hands the buffer back as is.
    for (const auto dir : {strata::direction::none, strata::direction::on_read}) {
      auto c = zstd.compress(strata::Buffer::borrowed(payload), {dir, strata::compressors::preset::medium}, {});
      assert(c->is_borrowed() && c->span().data() == payload.data());
      auto e = zstd.encrypt(strata::Buffer::borrowed(payload), dir, {key, std::nullopt, std::nullopt});
      assert(e->is_borrowed() && e->span().data() == payload.data());
      auto p = zstd.protect(strata::Buffer::borrowed(payload), {dir, strata::correctors::preset::basic});
      assert(p->is_borrowed() && p->span().data() == payload.data());
    }
    for (const auto dir : {strata::direction::none, strata::direction::on_write}) {
      auto c = zstd.decompress(strata::Buffer::borrowed(payload), {dir, strata::compressors::preset::medium}, {});
      assert(c->span().data() == payload.data());
      auto e = zstd.decrypt(strata::Buffer::borrowed(payload), dir, {key, std::nullopt});
      assert(e->span().data() == payload.data());
      auto r = zstd.recover(strata::Buffer::borrowed(payload), {dir, strata::correctors::preset::basic});
      assert(r->span().data() == payload.data());
    }
  }

  {
    // Written with zstd, read by a pipeline configured for zlib.
    const strata::compression_config both{strata::direction::both, strata::compressors::preset::medium};
    auto compressed = zstd.compress(strata::Buffer::borrowed(payload), both, std::nullopt);
    auto mismatch = zlib.decompress(std::move(*compressed), both, std::nullopt);
    assert(!mismatch.has_value());
    assert(mismatch.error().code == strata::error_code::method_mismatch);
    assert(mismatch.error().where == strata::stage::compression);
    const auto* detail = mismatch.error().get_if<strata::method_mismatch>();
    assert(detail->family == strata::layer::compression);
    assert(detail->expected == static_cast<std::uint8_t>(strata::compressors::method::zlib));
    assert(detail->found == static_cast<std::uint8_t>(strata::compressors::method::zstd));
  }

  {
    // Compressed bytes handed to the encryption stage.
    const strata::compression_config both{strata::direction::both, strata::compressors::preset::medium};
    auto compressed = zstd.compress(strata::Buffer::borrowed(payload), both, std::nullopt);
    auto mismatch = zstd.decrypt(std::move(*compressed), strata::direction::both, {key, std::nullopt});
    assert(!mismatch.has_value());
    assert(mismatch.error().code == strata::error_code::layer_mismatch);
    const auto* detail = mismatch.error().get_if<strata::layer_mismatch>();
    assert(detail->expected == strata::layer::encryption);
    assert(detail->found == strata::layer::compression);
  }

  {
    // Not even room for a descriptor.
    const std::vector<std::uint8_t> one = {0x01};
    auto underflow = zstd.decompress(strata::Buffer::borrowed(one), {strata::direction::both, {}}, std::nullopt);
    assert(!underflow.has_value());
    assert(underflow.error().where == strata::stage::compression);
    assert(underflow.error().code == strata::error_code::end_of_buffer);

    // Valid descriptor, truncated nonce.
    std::vector<std::uint8_t> truncated(5, 0);
    strata::TailWriter(truncated).write_descriptor(
        strata::descriptor(strata::encryptors::method::aes_gcm, strata::direction::both));
    auto short_tail = zstd.decrypt(strata::Buffer::borrowed(truncated), strata::direction::both, {key, std::nullopt});
    assert(!short_tail.has_value());
    assert(short_tail.error().where == strata::stage::encryption);
    const auto* eob = short_tail.error().get_if<strata::end_of_buffer>();
    assert(eob->bytes_read == strata::k_nonce_size && eob->bytes_remaining == 5);
  }

  return 0;
}
