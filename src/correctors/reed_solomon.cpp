#include <strata/correctors.hpp>
#include <strata/log.hpp>

#include <algorithm>
#include <bit>
#include <cstring>
#include <limits>

#include <sfl/small_vector.hpp>
#include <zlib.h>

#include "galois.hpp"

namespace strata::correctors {

std::size_t parity_shards(const level& lvl, std::size_t data_shards) {
  if (const auto* exact = std::get_if<exact_level>(&lvl)) {
    return exact->parity_shards;
  }
  switch (std::get<preset>(lvl)) {
    case preset::basic:
      return 1;
    case preset::standard:
      return std::max<std::size_t>(1, data_shards / 4);
    case preset::maximum:
      return std::max<std::size_t>(1, data_shards / 2);
  }
  return 1;
}

namespace {

constexpr std::size_t k_max_shards = 256;
constexpr std::size_t k_max_data_shards = 128;
constexpr std::size_t k_min_shard_size = 16;
constexpr std::size_t k_max_shard_size = 65536;
constexpr std::size_t k_checksum_size = sizeof(std::uint32_t);

std::size_t shard_count(std::size_t len, std::size_t shard_size) { return (len + shard_size - 1) / shard_size; }

// Power of two near a quarter of the payload, then widened until the data fits
// in 128 shards and narrowed so that anything over one byte spans two shards.
std::size_t shard_size_for(std::size_t len) {
  if (len <= 1) {
    return 1;
  }
  std::size_t size = std::clamp(std::bit_floor(std::max<std::size_t>(len / 4, 1)), k_min_shard_size, k_max_shard_size);
  while (shard_count(len, size) > k_max_data_shards) {
    size *= 2;
  }
  if (shard_count(len, size) < 2) {
    size = std::bit_floor(len / 2);
  }
  return size;
}

std::uint32_t checksum(const std::uint8_t* data, std::size_t len) {
  return static_cast<std::uint32_t>(::crc32(0L, data, static_cast<uInt>(len)));
}

struct layout {
  std::size_t data_len{};
  std::size_t data_shards{};
  std::size_t total_shards{};
  std::size_t shard_size{};

  [[nodiscard]] std::size_t parity() const { return total_shards - data_shards; }
};

result<std::size_t> read_field(TailReader& tail) {
  auto value = tail.read_u32_le();
  if (!value) {
    return tl::make_unexpected(at_stage(std::move(value.error()), stage::correction));
  }
  return static_cast<std::size_t>(*value);
}

result<layout> read_layout(TailReader& tail) {
  layout out;
  auto shard_size = read_field(tail);
  if (!shard_size) {
    return tl::make_unexpected(std::move(shard_size.error()));
  }
  auto total = read_field(tail);
  if (!total) {
    return tl::make_unexpected(std::move(total.error()));
  }
  auto data = read_field(tail);
  if (!data) {
    return tl::make_unexpected(std::move(data.error()));
  }
  auto data_len = read_field(tail);
  if (!data_len) {
    return tl::make_unexpected(std::move(data_len.error()));
  }
  out.shard_size = *shard_size;
  out.total_shards = *total;
  out.data_shards = *data;
  out.data_len = *data_len;

  if (out.shard_size == 0 || out.total_shards < 2 || out.total_shards > k_max_shards || out.data_shards == 0 ||
      out.data_shards >= out.total_shards ||
      static_cast<std::uint64_t>(out.data_len) >
          static_cast<std::uint64_t>(out.shard_size) * static_cast<std::uint64_t>(out.data_shards)) {
    return make_error(stage::correction,
                      error_code::invalid_parameters,
                      "invalid shard layout: {} data + {} parity shards of {} bytes for {} data bytes",
                      out.data_shards,
                      out.total_shards - std::min(out.total_shards, out.data_shards),
                      out.shard_size,
                      out.data_len);
  }
  return out;
}

class ReedSolomon final : public Corrector {
 public:
  [[nodiscard]] method id() const override { return method::reed_solomon; }

  // Layout: [data shards][parity shards][crc32 per shard]
  //         [u32 data_len][u32 data shards][u32 total shards][u32 shard size]
  result<byte_vector> protect(bytes_view input, const level& lvl) const override {
    if (input.size() > std::numeric_limits<std::uint32_t>::max()) {
      return make_error(stage::correction, error_code::protect_failed, "payload of {} bytes too large", input.size());
    }

    layout lay;
    lay.data_len = input.size();
    lay.shard_size = shard_size_for(input.size());
    lay.data_shards = std::max<std::size_t>(1, shard_count(input.size(), lay.shard_size));
    const std::size_t parity = parity_shards(lvl, lay.data_shards);
    lay.total_shards = lay.data_shards + parity;
    if (parity == 0 || lay.total_shards > k_max_shards) {
      return make_error(stage::correction,
                        error_code::protect_failed,
                        "{} data shards with {} parity shards is outside 1..{} parity and {} total",
                        lay.data_shards,
                        parity,
                        k_max_shards - lay.data_shards,
                        k_max_shards);
    }

    const std::size_t shard_bytes = lay.total_shards * lay.shard_size;
    byte_vector out;
    out.reserve(shard_bytes + lay.total_shards * k_checksum_size + 4 * sizeof(std::uint32_t) + descriptor::k_size);
    out.assign(input.begin(), input.end());
    out.resize(shard_bytes, 0);

    const auto encoding = detail::systematic_matrix(lay.data_shards, lay.total_shards);
    for (std::size_t p = 0; p < parity; ++p) {
      const std::size_t row = lay.data_shards + p;
      std::uint8_t* dst = out.data() + row * lay.shard_size;
      for (std::size_t d = 0; d < lay.data_shards; ++d) {
        detail::mul_add(encoding.at(row, d), out.data() + d * lay.shard_size, dst, lay.shard_size);
      }
    }

    TailWriter tail(out);
    for (std::size_t i = 0; i < lay.total_shards; ++i) {
      tail.write_u32_le(checksum(out.data() + i * lay.shard_size, lay.shard_size));
    }
    tail.write_u32_le(static_cast<std::uint32_t>(lay.data_len));
    tail.write_u32_le(static_cast<std::uint32_t>(lay.data_shards));
    tail.write_u32_le(static_cast<std::uint32_t>(lay.total_shards));
    tail.write_u32_le(static_cast<std::uint32_t>(lay.shard_size));
    return out;
  }

  result<Buffer> recover(Buffer stored, TailReader& tail) const override {
    auto lay = read_layout(tail);
    if (!lay) {
      return tl::make_unexpected(std::move(lay.error()));
    }
    auto checksums = tail.read_slice(lay->total_shards * k_checksum_size);
    if (!checksums) {
      return tl::make_unexpected(at_stage(std::move(checksums.error()), stage::correction));
    }
    const bytes_view shards = tail.remaining();
    if (static_cast<std::uint64_t>(shards.size()) !=
        static_cast<std::uint64_t>(lay->total_shards) * static_cast<std::uint64_t>(lay->shard_size)) {
      return make_error(stage::correction,
                        error_code::invalid_parameters,
                        "expected {} shard bytes, found {}",
                        lay->total_shards * lay->shard_size,
                        shards.size());
    }

    sfl::small_vector<std::size_t, 16> corrupted;
    for (std::size_t i = 0; i < lay->total_shards; ++i) {
      const std::uint32_t want = strata::detail::load_le<std::uint32_t>(checksums->data() + i * k_checksum_size);
      if (checksum(shards.data() + i * lay->shard_size, lay->shard_size) != want) {
        corrupted.push_back(i);
      }
    }

    if (corrupted.empty()) {
      return std::move(stored).prefix(lay->data_len);
    }

    if (corrupted.size() > lay->parity()) {
      // More damage than parity implies a data shard is among it; indices are ascending.
      const std::size_t first_data = corrupted.front();
      STRATA_LOG_DEBUG("{} corrupted shards exceed parity budget of {}", corrupted.size(), lay->parity());
      return make_error(stage::correction,
                        error_code::missing_shard,
                        missing_shard{first_data},
                        "{} of {} shards corrupted, parity budget is {}; first lost data shard is {}",
                        corrupted.size(),
                        lay->total_shards,
                        lay->parity(),
                        first_data);
    }

    stored.metadata().recovered = true;
    if (corrupted.front() >= lay->data_shards) {
      STRATA_LOG_WARN("{} parity shard(s) corrupted, data intact", corrupted.size());
      return std::move(stored).prefix(lay->data_len);
    }

    return reconstruct(*lay, shards, corrupted, stored.metadata());
  }

 private:
  template <typename T_Indices>
  static result<Buffer> reconstruct(const layout& lay,
                                    bytes_view shards,
                                    const T_Indices& corrupted,
                                    const Metadata& metadata) {
    // First `data_shards` intact shards, in index order.
    sfl::small_vector<std::size_t, 32> sources;
    for (std::size_t i = 0, c = 0; i < lay.total_shards && sources.size() < lay.data_shards; ++i) {
      if (c < corrupted.size() && corrupted[c] == i) {
        ++c;
        continue;
      }
      sources.push_back(i);
    }

    const auto encoding = detail::systematic_matrix(lay.data_shards, lay.total_shards);
    detail::matrix picked(lay.data_shards, lay.data_shards);
    for (std::size_t r = 0; r < lay.data_shards; ++r) {
      for (std::size_t c = 0; c < lay.data_shards; ++c) {
        picked.at(r, c) = encoding.at(sources[r], c);
      }
    }
    const auto decoding = picked.inverse();
    if (!decoding) {
      return make_error(stage::correction, error_code::invalid_parameters, "shard matrix is singular");
    }

    byte_vector out(lay.data_shards * lay.shard_size, 0);
    for (std::size_t d = 0; d < lay.data_shards; ++d) {
      std::uint8_t* dst = out.data() + d * lay.shard_size;
      const bool intact = std::find(corrupted.begin(), corrupted.end(), d) == corrupted.end();
      if (intact) {
        std::memcpy(dst, shards.data() + d * lay.shard_size, lay.shard_size);
        continue;
      }
      for (std::size_t s = 0; s < lay.data_shards; ++s) {
        detail::mul_add(decoding->at(d, s), shards.data() + sources[s] * lay.shard_size, dst, lay.shard_size);
      }
    }
    out.resize(lay.data_len);

    STRATA_LOG_WARN("reconstructed value from {} corrupted shard(s), first at index {}",
                    corrupted.size(),
                    corrupted.front());
    return Buffer(std::move(out), metadata);
  }
};

}  // namespace

std::unique_ptr<Corrector> make_reed_solomon() { return std::make_unique<ReedSolomon>(); }

}  // namespace strata::correctors
