#include <strata/descriptor.hpp>

#include <cassert>
#include <cstdint>
#include <vector>

namespace {

std::vector<strata::any_method> all_methods() {
  return {
      strata::serializers::method::bitsery,
      strata::compressors::method::zstd,
      strata::compressors::method::zlib,
      strata::encryptors::method::aes_gcm,
      strata::encryptors::method::chacha20,
      strata::correctors::method::reed_solomon,
  };
}

constexpr strata::direction k_directions[] = {
    strata::direction::none,
    strata::direction::on_read,
    strata::direction::on_write,
    strata::direction::both,
};

}  // namespace

int main() {
  // Every descriptor the encoder can produce decodes back to itself.
  for (const auto& method : all_methods()) {
    for (const auto dir : k_directions) {
      const strata::descriptor desc(method, dir);
      const std::uint16_t raw = desc.encode();
      assert((raw & strata::descriptor::k_reserved_mask) == 0);
      assert(raw == strata::encode(desc.kind(), strata::method_code(method), dir));

      const auto decoded = strata::decode(raw);
      assert(decoded.has_value());
      assert(*decoded == desc);
      assert(decoded->kind() == strata::layer_of(method));
      assert(decoded->dir() == dir);
    }
  }

  // Known bit patterns.
  {
    const strata::descriptor aes(strata::encryptors::method::aes_gcm, strata::direction::both);
    assert(aes.encode() == 0x0302);
    const strata::descriptor chacha(strata::encryptors::method::chacha20, strata::direction::on_write);
    assert(chacha.encode() == 0x020A);
    const strata::descriptor zlib(strata::compressors::method::zlib, strata::direction::on_read);
    assert(zlib.encode() == 0x0109);
  }

  // Exhaustive: every 16-bit value either round-trips or is rejected with a
  // corruption error; reserved bits always win.
  std::size_t accepted = 0;
  for (std::uint32_t raw = 0; raw <= 0xFFFF; ++raw) {
    const auto value = static_cast<std::uint16_t>(raw);
    const auto decoded = strata::descriptor::decode(value);
    if ((value & strata::descriptor::k_reserved_mask) != 0) {
      assert(!decoded.has_value());
      assert(decoded.error().code == strata::error_code::reservation_bits_set);
      const auto* detail = decoded.error().get_if<strata::raw_value>();
      assert(detail != nullptr);
      assert(detail->raw == value);
      continue;
    }
    if (decoded) {
      ++accepted;
      assert(decoded->encode() == value);
    } else {
      const auto code = decoded.error().code;
      assert(code == strata::error_code::unrecognized_layer || code == strata::error_code::unrecognized_method);
      assert(decoded.error().get_if<strata::raw_value>()->raw == value);
    }
  }
  assert(accepted == all_methods().size() * 4);

  {
    const auto bad_layer = strata::decode(0x0005);
    assert(!bad_layer.has_value());
    assert(bad_layer.error().code == strata::error_code::unrecognized_layer);

    // Compression method 31 does not exist.
    const auto bad_method = strata::decode(static_cast<std::uint16_t>(0x0001 | (31U << 3U)));
    assert(!bad_method.has_value());
    assert(bad_method.error().code == strata::error_code::unrecognized_method);
    assert(bad_method.error().get_if<strata::raw_value>()->family == strata::layer::compression);

    const auto reserved = strata::decode(0x8000);
    assert(!reserved.has_value());
    assert(reserved.error().code == strata::error_code::reservation_bits_set);
  }

  // Out-of-range field values stay inside their own bits.
  {
    const auto kind = static_cast<strata::layer>(9);
    const auto dir = static_cast<strata::direction>(7);
    const std::uint16_t raw = strata::encode(kind, 0x21, dir);
    assert((raw & strata::descriptor::k_reserved_mask) == 0);
    assert(raw == strata::encode(strata::layer::compression, 0x01, strata::direction::both));
    const auto decoded = strata::decode(raw);
    assert(decoded.has_value());
    assert(*decoded == strata::descriptor(strata::compressors::method::zlib, strata::direction::both));
  }

  {
    assert(strata::direction_from_code(3).value() == strata::direction::both);
    const auto bad = strata::direction_from_code(4);
    assert(!bad.has_value());
    assert(bad.error().code == strata::error_code::unrecognized_direction);

    assert(strata::is_write(strata::direction::both) && strata::is_read(strata::direction::both));
    assert(strata::is_write(strata::direction::on_write) && !strata::is_read(strata::direction::on_write));
    assert(!strata::is_write(strata::direction::on_read) && strata::is_read(strata::direction::on_read));
    assert(!strata::is_write(strata::direction::none) && !strata::is_read(strata::direction::none));
  }

  {
    assert(strata::parse_direction("on-write") == strata::direction::on_write);
    assert(!strata::parse_direction("sideways").has_value());
    assert(strata::compressors::parse_method("zlib") == strata::compressors::method::zlib);
    assert(strata::encryptors::method_name(strata::encryptors::method::chacha20) == "chacha20");
    assert(strata::correctors::parse_method("reed-solomon") == strata::correctors::method::reed_solomon);
    assert(!strata::serializers::parse_method("json").has_value());
  }

  return 0;
}
