#include <strata/descriptor.hpp>

namespace strata {

std::string_view direction_name(direction dir) {
  switch (dir) {
    case direction::none:
      return "none";
    case direction::on_read:
      return "on-read";
    case direction::on_write:
      return "on-write";
    case direction::both:
      return "both";
  }
  return "unknown";
}

result<direction> direction_from_code(std::uint8_t code) {
  if (code > static_cast<std::uint8_t>(direction::both)) {
    return make_error(stage::none,
                      error_code::unrecognized_direction,
                      raw_value{code, layer::serialization},
                      "unrecognized direction code {}",
                      code);
  }
  return static_cast<direction>(code);
}

std::optional<direction> parse_direction(std::string_view name) {
  if (name == "none") {
    return direction::none;
  }
  if (name == "on-read") {
    return direction::on_read;
  }
  if (name == "on-write") {
    return direction::on_write;
  }
  if (name == "both") {
    return direction::both;
  }
  return std::nullopt;
}

namespace serializers {

std::string_view method_name(method value) {
  switch (value) {
    case method::bitsery:
      return "bitsery";
  }
  return "unknown";
}

std::optional<method> parse_method(std::string_view name) {
  if (name == "bitsery") {
    return method::bitsery;
  }
  return std::nullopt;
}

}  // namespace serializers

namespace compressors {

std::string_view method_name(method value) {
  switch (value) {
    case method::zstd:
      return "zstd";
    case method::zlib:
      return "zlib";
  }
  return "unknown";
}

std::optional<method> parse_method(std::string_view name) {
  if (name == "zstd") {
    return method::zstd;
  }
  if (name == "zlib") {
    return method::zlib;
  }
  return std::nullopt;
}

}  // namespace compressors

namespace encryptors {

std::string_view method_name(method value) {
  switch (value) {
    case method::aes_gcm:
      return "aes-gcm";
    case method::chacha20:
      return "chacha20";
  }
  return "unknown";
}

std::optional<method> parse_method(std::string_view name) {
  if (name == "aes-gcm") {
    return method::aes_gcm;
  }
  if (name == "chacha20") {
    return method::chacha20;
  }
  return std::nullopt;
}

}  // namespace encryptors

namespace correctors {

std::string_view method_name(method value) {
  switch (value) {
    case method::reed_solomon:
      return "reed-solomon";
  }
  return "unknown";
}

std::optional<method> parse_method(std::string_view name) {
  if (name == "reed-solomon") {
    return method::reed_solomon;
  }
  return std::nullopt;
}

}  // namespace correctors

namespace {

// Maps a method code to the family enum, rejecting codes with no backend.
result<any_method> decode_method(layer kind, std::uint8_t code, std::uint16_t raw) {
  switch (kind) {
    case layer::serialization:
      if (code == static_cast<std::uint8_t>(serializers::method::bitsery)) {
        return any_method{static_cast<serializers::method>(code)};
      }
      break;
    case layer::compression:
      if (code <= static_cast<std::uint8_t>(compressors::method::zlib)) {
        return any_method{static_cast<compressors::method>(code)};
      }
      break;
    case layer::encryption:
      if (code <= static_cast<std::uint8_t>(encryptors::method::chacha20)) {
        return any_method{static_cast<encryptors::method>(code)};
      }
      break;
    case layer::correction:
      if (code == static_cast<std::uint8_t>(correctors::method::reed_solomon)) {
        return any_method{static_cast<correctors::method>(code)};
      }
      break;
  }
  return make_error(stage::none,
                    error_code::unrecognized_method,
                    raw_value{raw, kind},
                    "unrecognized {} method code {} in descriptor {:#06x}",
                    layer_name(kind),
                    code,
                    raw);
}

}  // namespace

result<descriptor> descriptor::decode(std::uint16_t raw) {
  if ((raw & k_reserved_mask) != 0U) {
    return make_error(stage::none,
                      error_code::reservation_bits_set,
                      raw_value{raw, layer::serialization},
                      "reserved bits set in descriptor {:#06x}",
                      raw);
  }

  const auto layer_code = static_cast<std::uint8_t>(raw & k_layer_mask);
  if (layer_code > static_cast<std::uint8_t>(layer::correction)) {
    return make_error(stage::none,
                      error_code::unrecognized_layer,
                      raw_value{raw, layer::serialization},
                      "unrecognized layer code {} in descriptor {:#06x}",
                      layer_code,
                      raw);
  }
  const auto kind = static_cast<layer>(layer_code);

  auto method = decode_method(kind, static_cast<std::uint8_t>((raw & k_method_mask) >> k_method_shift), raw);
  if (!method) {
    return tl::make_unexpected(std::move(method.error()));
  }

  auto dir = direction_from_code(static_cast<std::uint8_t>((raw & k_direction_mask) >> k_direction_shift));
  if (!dir) {
    return tl::make_unexpected(std::move(dir.error()));
  }

  return descriptor(*method, *dir);
}

}  // namespace strata
