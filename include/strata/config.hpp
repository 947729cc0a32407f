#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <variant>

#include "strata/buffer.hpp"
#include "strata/descriptor.hpp"

namespace strata {

namespace compressors {

struct exact_level {
  int code{};

  friend bool operator==(const exact_level&, const exact_level&) = default;
};

// Speed/ratio tradeoff. `exact_level` passes a backend-specific code through.
enum class preset : std::uint8_t { minimum, medium, maximum };

using level = std::variant<preset, exact_level>;

}  // namespace compressors

namespace correctors {

struct exact_level {
  std::size_t parity_shards{};

  friend bool operator==(const exact_level&, const exact_level&) = default;
};

// basic: 1 parity shard, standard: data/4, maximum: data/2 (each at least 1).
enum class preset : std::uint8_t { basic, standard, maximum };

using level = std::variant<preset, exact_level>;

std::size_t parity_shards(const level& lvl, std::size_t data_shards);

}  // namespace correctors

struct compression_config {
  direction dir{direction::none};
  compressors::level level{compressors::preset::medium};
};

struct correction_config {
  direction dir{direction::none};
  correctors::level level{correctors::preset::basic};
};

// Static per-type stage configuration. Never stored with the value: reader and
// writer of a type must agree on it.
struct type_config {
  direction serialization{direction::both};
  compression_config compression{};
  direction encryption{direction::none};
  correction_config correction{};

  static type_config plain() { return {}; }

  static type_config compressed(compressors::level lvl = compressors::preset::medium) {
    type_config cfg;
    cfg.compression = {direction::both, lvl};
    return cfg;
  }

  static type_config sealed() {
    type_config cfg;
    cfg.compression = {direction::both, compressors::preset::medium};
    cfg.encryption = direction::both;
    return cfg;
  }

  static type_config with_parity(correctors::level lvl = correctors::preset::standard) {
    type_config cfg;
    cfg.correction = {direction::both, lvl};
    return cfg;
  }
};

inline constexpr std::size_t k_key_size = 32;
inline constexpr std::size_t k_nonce_size = 12;
inline constexpr std::size_t k_tag_size = 16;

using nonce = std::array<std::uint8_t, k_nonce_size>;

// Key material for one value. A key may seal at most 2^32 values with random
// nonces; past that the nonce collision probability exceeds NIST SP 800-38D
// bounds and nonces must be managed by the caller.
struct write_args {
  bytes_view key{};
  std::optional<nonce> nonce_override{};
  std::optional<bytes_view> dictionary{};
};

struct read_args {
  bytes_view key{};
  std::optional<bytes_view> dictionary{};
};

}  // namespace strata
