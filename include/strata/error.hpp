#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/format.h>
#include <tl/expected.hpp>

namespace strata {

enum class layer : std::uint8_t {
  serialization = 0,
  compression = 1,
  encryption = 2,
  correction = 3,
};

inline constexpr std::string_view layer_name(layer value) {
  switch (value) {
    case layer::serialization:
      return "serialization";
    case layer::compression:
      return "compression";
    case layer::encryption:
      return "encryption";
    case layer::correction:
      return "correction";
  }
  return "unknown";
}

// Where an error surfaced. Pipeline stages re-tag errors from their backend.
enum class stage : std::uint8_t {
  none,
  serialization,
  compression,
  encryption,
  correction,
  table,
  store,
  config,
};

inline constexpr std::string_view stage_name(stage value) {
  switch (value) {
    case stage::none:
      return "none";
    case stage::serialization:
      return "serialization";
    case stage::compression:
      return "compression";
    case stage::encryption:
      return "encryption";
    case stage::correction:
      return "correction";
    case stage::table:
      return "table";
    case stage::store:
      return "store";
    case stage::config:
      return "config";
  }
  return "unknown";
}

inline constexpr stage stage_of(layer value) {
  switch (value) {
    case layer::serialization:
      return stage::serialization;
    case layer::compression:
      return stage::compression;
    case layer::encryption:
      return stage::encryption;
    case layer::correction:
      return stage::correction;
  }
  return stage::none;
}

enum class error_code : std::uint8_t {
  unrecognized_layer,
  unrecognized_method,
  unrecognized_direction,
  reservation_bits_set,
  end_of_buffer,
  layer_mismatch,
  method_mismatch,
  serialize_failed,
  deserialize_failed,
  unexpected_payload,
  compress_failed,
  decompress_failed,
  invalid_key,
  encrypt_failed,
  decrypt_failed,
  protect_failed,
  invalid_parameters,
  missing_shard,
  not_found,
  store_failed,
  invalid_configuration,
};

inline constexpr std::string_view error_code_message(error_code code) {
  switch (code) {
    case error_code::unrecognized_layer:
      return "unrecognized_layer";
    case error_code::unrecognized_method:
      return "unrecognized_method";
    case error_code::unrecognized_direction:
      return "unrecognized_direction";
    case error_code::reservation_bits_set:
      return "reservation_bits_set";
    case error_code::end_of_buffer:
      return "end_of_buffer";
    case error_code::layer_mismatch:
      return "layer_mismatch";
    case error_code::method_mismatch:
      return "method_mismatch";
    case error_code::serialize_failed:
      return "serialize_failed";
    case error_code::deserialize_failed:
      return "deserialize_failed";
    case error_code::unexpected_payload:
      return "unexpected_payload";
    case error_code::compress_failed:
      return "compress_failed";
    case error_code::decompress_failed:
      return "decompress_failed";
    case error_code::invalid_key:
      return "invalid_key";
    case error_code::encrypt_failed:
      return "encrypt_failed";
    case error_code::decrypt_failed:
      return "decrypt_failed";
    case error_code::protect_failed:
      return "protect_failed";
    case error_code::invalid_parameters:
      return "invalid_parameters";
    case error_code::missing_shard:
      return "missing_shard";
    case error_code::not_found:
      return "not_found";
    case error_code::store_failed:
      return "store_failed";
    case error_code::invalid_configuration:
      return "invalid_configuration";
  }
  return "unknown";
}

// Diagnostic payloads. Each error carries at most one of these.

// Raw descriptor bits that failed to decode. `family` is meaningful for
// unrecognized_method only.
struct raw_value {
  std::uint16_t raw{};
  layer family{layer::serialization};
};

struct end_of_buffer {
  std::size_t bytes_read{};
  std::size_t bytes_remaining{};
};

struct layer_mismatch {
  layer expected{};
  layer found{};
};

struct method_mismatch {
  layer family{};
  std::uint8_t expected{};
  std::uint8_t found{};
};

struct missing_shard {
  std::size_t index{};
};

struct not_found {
  std::string table_name;
  std::vector<std::uint8_t> key_bytes;
};

using error_detail =
    std::variant<std::monostate, raw_value, end_of_buffer, layer_mismatch, method_mismatch, missing_shard, not_found>;

struct error {
  stage where{stage::none};
  error_code code{};
  error_detail detail{};
  std::string message;

  [[nodiscard]] std::string to_string() const {
    return fmt::format("{} error ({}): {}", stage_name(where), error_code_message(code), message);
  }

  template <typename T_Detail>
  [[nodiscard]] const T_Detail* get_if() const {
    return std::get_if<T_Detail>(&detail);
  }
};

template <typename T>
using result = tl::expected<T, error>;

template <typename... Args>
tl::unexpected<error> make_error(stage where, error_code code, fmt::format_string<Args...> format, Args&&... args) {
  return tl::make_unexpected(error{where, code, std::monostate{}, fmt::format(format, std::forward<Args>(args)...)});
}

template <typename... Args>
tl::unexpected<error> make_error(stage where,
                                 error_code code,
                                 error_detail detail,
                                 fmt::format_string<Args...> format,
                                 Args&&... args) {
  return tl::make_unexpected(error{where, code, std::move(detail), fmt::format(format, std::forward<Args>(args)...)});
}

// Re-tags an error with the stage that surfaced it, leaving everything else intact.
inline error at_stage(error err, stage where) {
  err.where = where;
  return err;
}

}  // namespace strata
