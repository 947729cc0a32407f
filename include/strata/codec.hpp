#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <type_traits>
#include <vector>

#include <bitsery/adapter/buffer.h>
#include <bitsery/deserializer.h>
#include <bitsery/serializer.h>
#include <bitsery/traits/array.h>
#include <bitsery/traits/core/traits.h>
#include <bitsery/traits/string.h>
#include <bitsery/traits/vector.h>

#include "strata/buffer.hpp"
#include "strata/error.hpp"

// Lets bitsery read straight out of a borrowed span, so deserializing a value
// stored in the database does not copy the bytes first.
namespace bitsery::traits {

template <>
struct ContainerTraits<std::span<const std::uint8_t>> {
  using TValue = std::uint8_t;
  static constexpr bool isResizable = false;
  static constexpr bool isContiguous = true;
  static std::size_t size(const std::span<const std::uint8_t>& container) { return container.size(); }
};

template <>
struct BufferAdapterTraits<std::span<const std::uint8_t>> {
  using TIterator = std::span<const std::uint8_t>::iterator;
  using TConstIterator = std::span<const std::uint8_t>::iterator;
  using TValue = std::uint8_t;
};

}  // namespace bitsery::traits

namespace strata {

// Big-endian so that encoded unsigned integers compare bytewise in numeric order.
struct bitsery_config {
  static constexpr bitsery::EndiannessType Endianness = bitsery::EndiannessType::BigEndian;
  static constexpr bool CheckDataErrors = true;
  static constexpr bool CheckAdapterErrors = true;
};

using output_adapter = bitsery::OutputBufferAdapter<byte_vector, bitsery_config>;
using input_adapter = bitsery::InputBufferAdapter<std::span<const std::uint8_t>, bitsery_config>;

inline constexpr std::size_t k_max_text_bytes = std::size_t{1} << 30;
inline constexpr std::size_t k_max_blob_bytes = std::size_t{1} << 30;

namespace detail {

template <typename T>
struct is_byte_array : std::false_type {};

template <std::size_t N>
struct is_byte_array<std::array<std::uint8_t, N>> : std::true_type {};

template <typename S, typename T>
void serialize_root(S& s, T& value) {
  if constexpr (std::is_same_v<T, bool>) {
    s.boolValue(value);
  } else if constexpr (std::is_arithmetic_v<T> || std::is_enum_v<T>) {
    s.template value<sizeof(T)>(value);
  } else if constexpr (std::is_same_v<T, std::string>) {
    s.text1b(value, k_max_text_bytes);
  } else if constexpr (std::is_same_v<T, byte_vector>) {
    s.container1b(value, k_max_blob_bytes);
  } else if constexpr (is_byte_array<T>::value) {
    s.container1b(value);
  } else {
    s.object(value);
  }
}

}  // namespace detail

// Encodes T with bitsery. Builtins are handled here; any other type needs a
// `serialize(S&, T&)` that bitsery can find.
template <typename T>
struct codec {
  static result<byte_vector> encode(const T& value) {
    byte_vector out;
    bitsery::Serializer<output_adapter> ser{output_adapter{out}};
    // bitsery serializes through a non-const reference but never writes to it.
    detail::serialize_root(ser, const_cast<T&>(value));
    ser.adapter().flush();
    out.resize(ser.adapter().writtenBytesCount());
    return out;
  }

  static result<T> decode(bytes_view bytes) {
    static_assert(std::is_default_constructible_v<T>, "codec<T>::decode requires default-constructible T");
    T value{};
    bitsery::Deserializer<input_adapter> des{input_adapter{bytes.begin(), bytes.size()}};
    detail::serialize_root(des, value);
    const auto err = des.adapter().error();
    if (err != bitsery::ReaderError::NoError) {
      return make_error(stage::serialization,
                        error_code::deserialize_failed,
                        "bitsery reader error {} after {} of {} bytes",
                        static_cast<int>(err),
                        des.adapter().currentReadPos(),
                        bytes.size());
    }
    if (!des.adapter().isCompletedSuccessfully()) {
      return make_error(stage::serialization,
                        error_code::deserialize_failed,
                        "{} trailing bytes after value",
                        bytes.size() - des.adapter().currentReadPos());
    }
    return value;
  }
};

// Set when the byte-lexicographic order of codec<T> output equals T's natural
// order. Range queries over a key type require it. User types opt in by
// specializing this trait.
template <typename T>
struct ordered_when_serialized : std::false_type {};

template <std::unsigned_integral T>
  requires(!std::is_same_v<T, bool>)
struct ordered_when_serialized<T> : std::true_type {};

template <std::size_t N>
struct ordered_when_serialized<std::array<std::uint8_t, N>> : std::true_type {};

template <typename T>
inline constexpr bool ordered_when_serialized_v = ordered_when_serialized<T>::value;

template <typename T>
concept ordered_key = ordered_when_serialized_v<T>;

}  // namespace strata
