#include <strata/tail.hpp>

#include <cassert>
#include <cstdint>
#include <vector>

int main() {
  {
    const std::vector<std::uint8_t> window = {1, 2, 3};
    strata::TailReader tail(window);

    const auto too_much = tail.read_slice(5);
    assert(!too_much.has_value());
    assert(too_much.error().code == strata::error_code::end_of_buffer);
    const auto* eob = too_much.error().get_if<strata::end_of_buffer>();
    assert(eob != nullptr);
    assert(eob->bytes_read == 5);
    assert(eob->bytes_remaining == 3);
    // A failed read leaves the window untouched.
    assert(tail.size() == 3);

    const auto all = tail.read_slice(3);
    assert(all.has_value());
    assert(all->size() == 3);
    assert(all->data() == window.data());
    assert(tail.empty());

    const auto nothing_left = tail.read_array<1>();
    assert(!nothing_left.has_value());
    assert(nothing_left.error().get_if<strata::end_of_buffer>()->bytes_remaining == 0);
  }

  {
    // Blocks come back in reverse order of writing.
    std::vector<std::uint8_t> out = {0xAA, 0xBB};
    strata::TailWriter writer(out);
    writer.write_u32_le(0x01020304U);
    const std::vector<std::uint8_t> nonce_like = {9, 8, 7};
    writer.write(nonce_like);
    writer.write_descriptor(strata::descriptor(strata::compressors::method::zstd, strata::direction::both));
    assert(out.size() == 2 + 4 + 3 + 2);
    assert(out[2] == 0x04 && out[5] == 0x01);

    strata::TailReader tail(out);
    const auto desc = tail.read_descriptor();
    assert(desc.has_value());
    assert(desc->kind() == strata::layer::compression);
    assert(desc->dir() == strata::direction::both);

    const auto tail_bytes = tail.read_array<3>();
    assert(tail_bytes.has_value());
    assert((*tail_bytes)[0] == 9 && (*tail_bytes)[2] == 7);

    const auto length = tail.read_u32_le();
    assert(length.has_value());
    assert(*length == 0x01020304U);

    assert(tail.size() == 2);
    assert(tail.remaining()[0] == 0xAA && tail.remaining()[1] == 0xBB);
  }

  {
    // A descriptor with reserved bits is reported as such, not as underflow.
    const std::vector<std::uint8_t> bogus = {0x00, 0x80};
    strata::TailReader tail(bogus);
    const auto desc = tail.read_descriptor();
    assert(!desc.has_value());
    assert(desc.error().code == strata::error_code::reservation_bits_set);
  }

  {
    const std::vector<std::uint8_t> one = {0x07};
    strata::TailReader tail(one);
    const auto desc = tail.read_descriptor();
    assert(!desc.has_value());
    const auto* eob = desc.error().get_if<strata::end_of_buffer>();
    assert(eob->bytes_read == 2 && eob->bytes_remaining == 1);
  }

  return 0;
}
