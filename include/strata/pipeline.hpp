#pragma once

#include <optional>
#include <utility>

#include "strata/backends.hpp"
#include "strata/buffer.hpp"
#include "strata/codec.hpp"
#include "strata/config.hpp"
#include "strata/error.hpp"
#include "strata/value.hpp"

namespace strata {

template <typename T>
struct decoded {
  T value;
  Metadata metadata;
};

// Runs the four stages in fixed order:
//
//   write: serialize -> compress -> encrypt -> protect
//   read:  recover -> decrypt -> decompress -> deserialize
//
// Each stage passes its buffer through untouched when the type's direction for
// that stage excludes the current operation. The first failing stage ends the
// call; its error is returned tagged with the stage.
class Pipeline {
 public:
  explicit Pipeline(Backends backends) : backends_(std::move(backends)) {}

  [[nodiscard]] const Backends& backends() const { return backends_; }

  result<Buffer> compress(Buffer payload, const compression_config& cfg, std::optional<bytes_view> dictionary) const;
  result<Buffer> decompress(Buffer stored, const compression_config& cfg, std::optional<bytes_view> dictionary) const;

  result<Buffer> encrypt(Buffer payload, direction dir, const write_args& args) const;
  result<Buffer> decrypt(Buffer stored, direction dir, const read_args& args) const;

  result<Buffer> protect(Buffer payload, const correction_config& cfg) const;
  result<Buffer> recover(Buffer stored, const correction_config& cfg) const;

  // Byte stages only, for payloads that are already serialized.
  result<Buffer> write_bytes(Buffer serialized, const type_config& cfg, const write_args& args) const;
  result<Buffer> read_bytes(Buffer stored, const type_config& cfg, const read_args& args) const;

  template <typename T>
  static result<Buffer> serialize(ValueOrBytes<T> input, direction dir) {
    if (!is_write(dir)) {
      if (!input.is_bytes()) {
        return make_error(stage::serialization,
                          error_code::unexpected_payload,
                          "serialization is off for writes ({}); expected serialized bytes",
                          direction_name(dir));
      }
      return std::move(input).into_bytes();
    }
    if (!input.is_value()) {
      return make_error(stage::serialization,
                        error_code::unexpected_payload,
                        "serialization is on for writes ({}); expected a value",
                        direction_name(dir));
    }
    auto bytes = codec<T>::encode(input.value().get());
    if (!bytes) {
      return tl::make_unexpected(at_stage(std::move(bytes.error()), stage::serialization));
    }
    return Buffer(std::move(*bytes));
  }

  template <typename T>
  static result<ValueOrBytes<T>> deserialize(Buffer stored, direction dir) {
    if (!is_read(dir)) {
      return ValueOrBytes<T>(std::move(stored));
    }
    auto value = codec<T>::decode(stored.span());
    if (!value) {
      return tl::make_unexpected(at_stage(std::move(value.error()), stage::serialization));
    }
    return ValueOrBytes<T>(Value<T>::owned(std::move(*value)));
  }

  template <typename T>
  result<Buffer> write_payload(ValueOrBytes<T> input, const type_config& cfg, const write_args& args) const {
    auto serialized = serialize<T>(std::move(input), cfg.serialization);
    if (!serialized) {
      return tl::make_unexpected(std::move(serialized.error()));
    }
    return write_bytes(std::move(*serialized), cfg, args);
  }

  template <typename T>
  result<Buffer> write(const T& value, const type_config& cfg, const write_args& args) const {
    return write_payload<T>(ValueOrBytes<T>(Value<T>::borrowed(value)), cfg, args);
  }

  template <typename T>
  result<ValueOrBytes<T>> read_payload(Buffer stored, const type_config& cfg, const read_args& args) const {
    auto bytes = read_bytes(std::move(stored), cfg, args);
    if (!bytes) {
      return tl::make_unexpected(std::move(bytes.error()));
    }
    return deserialize<T>(std::move(*bytes), cfg.serialization);
  }

  template <typename T>
  result<decoded<T>> read_with_metadata(Buffer stored, const type_config& cfg, const read_args& args) const {
    if (!is_read(cfg.serialization)) {
      return make_error(stage::serialization,
                        error_code::unexpected_payload,
                        "serialization is off for reads ({}); use read_payload",
                        direction_name(cfg.serialization));
    }
    auto bytes = read_bytes(std::move(stored), cfg, args);
    if (!bytes) {
      return tl::make_unexpected(std::move(bytes.error()));
    }
    auto value = codec<T>::decode(bytes->span());
    if (!value) {
      return tl::make_unexpected(at_stage(std::move(value.error()), stage::serialization));
    }
    return decoded<T>{std::move(*value), bytes->metadata()};
  }

  template <typename T>
  result<T> read(Buffer stored, const type_config& cfg, const read_args& args) const {
    auto out = read_with_metadata<T>(std::move(stored), cfg, args);
    if (!out) {
      return tl::make_unexpected(std::move(out.error()));
    }
    return std::move(out->value);
  }

 private:
  Backends backends_;
};

}  // namespace strata
