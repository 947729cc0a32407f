#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <type_traits>

#include "strata/buffer.hpp"
#include "strata/descriptor.hpp"
#include "strata/error.hpp"

namespace strata {

namespace detail {

template <typename UInt>
constexpr UInt load_le(const std::uint8_t* src) {
  static_assert(std::is_unsigned_v<UInt>, "load_le expects unsigned type");
  UInt value = 0;
  for (std::size_t i = 0; i < sizeof(UInt); ++i) {
    value = static_cast<UInt>(value | (static_cast<UInt>(src[i]) << (8U * i)));
  }
  return value;
}

template <typename UInt>
void store_le(byte_vector& out, UInt value) {
  static_assert(std::is_unsigned_v<UInt>, "store_le expects unsigned type");
  for (std::size_t i = 0; i < sizeof(UInt); ++i) {
    out.push_back(static_cast<std::uint8_t>((value >> (8U * i)) & 0xFFU));
  }
}

}  // namespace detail

// Reads stage parameters from the end of a buffer. The window shrinks from the
// right; whatever is left of it is the payload of the stage being reversed.
class TailReader {
 public:
  explicit TailReader(bytes_view window) : window_(window) {}

  [[nodiscard]] bytes_view remaining() const { return window_; }

  [[nodiscard]] std::size_t size() const { return window_.size(); }

  [[nodiscard]] bool empty() const { return window_.empty(); }

  [[nodiscard]] result<bytes_view> read_slice(std::size_t n) {
    if (n > window_.size()) {
      return make_error(stage::none,
                        error_code::end_of_buffer,
                        end_of_buffer{n, window_.size()},
                        "tail underflow: requested {} bytes, {} remaining",
                        n,
                        window_.size());
    }
    const auto out = window_.last(n);
    window_ = window_.first(window_.size() - n);
    return out;
  }

  template <std::size_t N>
  [[nodiscard]] result<std::span<const std::uint8_t, N>> read_array() {
    auto slice = read_slice(N);
    if (!slice) {
      return tl::make_unexpected(std::move(slice.error()));
    }
    return slice->template first<N>();
  }

  [[nodiscard]] result<std::uint16_t> read_u16_le() { return read_le<std::uint16_t>(); }

  [[nodiscard]] result<std::uint32_t> read_u32_le() { return read_le<std::uint32_t>(); }

  [[nodiscard]] result<descriptor> read_descriptor() {
    auto raw = read_u16_le();
    if (!raw) {
      return tl::make_unexpected(std::move(raw.error()));
    }
    return descriptor::decode(*raw);
  }

 private:
  template <typename UInt>
  result<UInt> read_le() {
    auto bytes = read_array<sizeof(UInt)>();
    if (!bytes) {
      return tl::make_unexpected(std::move(bytes.error()));
    }
    return detail::load_le<UInt>(bytes->data());
  }

  bytes_view window_;
};

// Appends stage parameters after a payload. Blocks are written in the order
// the reader consumes them reversed, so the descriptor always goes last.
class TailWriter {
 public:
  explicit TailWriter(byte_vector& out) : out_(out) {}

  void write(bytes_view bytes) { out_.insert(out_.end(), bytes.begin(), bytes.end()); }

  void write_u16_le(std::uint16_t value) { detail::store_le(out_, value); }

  void write_u32_le(std::uint32_t value) { detail::store_le(out_, value); }

  void write_descriptor(const descriptor& desc) { write_u16_le(desc.encode()); }

 private:
  byte_vector& out_;
};

}  // namespace strata
