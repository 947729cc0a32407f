#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>

#include "strata/error.hpp"

namespace strata {

enum class direction : std::uint8_t {
  none = 0,
  on_read = 1,
  on_write = 2,
  both = 3,
};

[[nodiscard]] inline constexpr bool is_read(direction dir) {
  return dir == direction::on_read || dir == direction::both;
}

[[nodiscard]] inline constexpr bool is_write(direction dir) {
  return dir == direction::on_write || dir == direction::both;
}

std::string_view direction_name(direction dir);

result<direction> direction_from_code(std::uint8_t code);

std::optional<direction> parse_direction(std::string_view name);

namespace serializers {

enum class method : std::uint8_t {
  bitsery = 0,
};

std::string_view method_name(method value);
std::optional<method> parse_method(std::string_view name);

}  // namespace serializers

namespace compressors {

enum class method : std::uint8_t {
  zstd = 0,
  zlib = 1,
};

std::string_view method_name(method value);
std::optional<method> parse_method(std::string_view name);

}  // namespace compressors

namespace encryptors {

enum class method : std::uint8_t {
  aes_gcm = 0,
  chacha20 = 1,
};

std::string_view method_name(method value);
std::optional<method> parse_method(std::string_view name);

}  // namespace encryptors

namespace correctors {

enum class method : std::uint8_t {
  reed_solomon = 0,
};

std::string_view method_name(method value);
std::optional<method> parse_method(std::string_view name);

}  // namespace correctors

// The alternative index equals the numeric layer code.
using any_method = std::variant<serializers::method, compressors::method, encryptors::method, correctors::method>;

[[nodiscard]] inline constexpr layer layer_of(const any_method& m) { return static_cast<layer>(m.index()); }

[[nodiscard]] inline constexpr std::uint8_t method_code(const any_method& m) {
  return std::visit([](auto value) { return static_cast<std::uint8_t>(value); }, m);
}

// Identifies one applied stage instance. Packed as 16 bits:
//
//   bits 0-2   layer      (8 stage kinds)
//   bits 3-7   method     (32 backends per stage)
//   bits 8-9   direction
//   bits 10-15 reserved, must be zero
class descriptor {
 public:
  static constexpr std::uint16_t k_layer_mask = 0x0007;
  static constexpr std::uint16_t k_method_mask = 0x00F8;
  static constexpr std::uint16_t k_direction_mask = 0x0300;
  static constexpr std::uint16_t k_reserved_mask = 0xFC00;
  static constexpr unsigned k_method_shift = 3;
  static constexpr unsigned k_direction_shift = 8;
  static constexpr std::size_t k_size = sizeof(std::uint16_t);

  constexpr descriptor(any_method method, direction dir) : method_(method), direction_(dir) {}

  [[nodiscard]] constexpr layer kind() const { return layer_of(method_); }

  [[nodiscard]] constexpr const any_method& method() const { return method_; }

  [[nodiscard]] constexpr direction dir() const { return direction_; }

  [[nodiscard]] constexpr std::uint16_t encode() const {
    return static_cast<std::uint16_t>(static_cast<unsigned>(kind()) |
                                      (static_cast<unsigned>(method_code(method_)) << k_method_shift) |
                                      (static_cast<unsigned>(direction_) << k_direction_shift));
  }

  static result<descriptor> decode(std::uint16_t raw);

  friend constexpr bool operator==(const descriptor&, const descriptor&) = default;

 private:
  any_method method_;
  direction direction_;
};

[[nodiscard]] inline constexpr std::uint16_t encode(layer kind, std::uint8_t method, direction dir) {
  return static_cast<std::uint16_t>((static_cast<unsigned>(kind) & descriptor::k_layer_mask) |
                                    ((static_cast<unsigned>(method) << descriptor::k_method_shift) & descriptor::k_method_mask) |
                                    ((static_cast<unsigned>(dir) << descriptor::k_direction_shift) &
                                     descriptor::k_direction_mask));
}

inline result<descriptor> decode(std::uint16_t raw) { return descriptor::decode(raw); }

}  // namespace strata
