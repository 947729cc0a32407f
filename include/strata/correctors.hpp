#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>

#include "strata/buffer.hpp"
#include "strata/config.hpp"
#include "strata/descriptor.hpp"
#include "strata/error.hpp"
#include "strata/tail.hpp"

namespace strata::correctors {

// Erasure coding backend. `protect` returns data shards, parity shards and the
// shard layout; `recover` reads the layout from `tail`, verifies every shard
// and returns the original payload, reconstructing it when needed.
class Corrector {
 public:
  virtual ~Corrector() = default;

  [[nodiscard]] virtual method id() const = 0;

  virtual result<byte_vector> protect(bytes_view input, const level& lvl) const = 0;

  // `stored` is the whole buffer the tail was taken from; its prefix is
  // returned without copying when no shard is damaged.
  virtual result<Buffer> recover(Buffer stored, TailReader& tail) const = 0;
};

std::unique_ptr<Corrector> make_reed_solomon();

}  // namespace strata::correctors
