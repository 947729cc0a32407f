#pragma once

#include <memory>
#include <optional>

#include "strata/buffer.hpp"
#include "strata/config.hpp"
#include "strata/descriptor.hpp"
#include "strata/error.hpp"
#include "strata/tail.hpp"

namespace strata::compressors {

// One compression backend. `compress` returns the compressed payload followed
// by any parameters the backend needs to invert itself; `decompress` consumes
// those parameters from `tail` and inflates what remains of it.
class Compressor {
 public:
  virtual ~Compressor() = default;

  [[nodiscard]] virtual method id() const = 0;

  virtual result<byte_vector> compress(bytes_view input, const level& lvl, std::optional<bytes_view> dictionary) const = 0;

  virtual result<byte_vector> decompress(TailReader& tail, std::optional<bytes_view> dictionary) const = 0;
};

std::unique_ptr<Compressor> make_zstd();
std::unique_ptr<Compressor> make_zlib();

}  // namespace strata::compressors
