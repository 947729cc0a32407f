#include <strata/compressors.hpp>

#include <algorithm>
#include <limits>

#include <zlib.h>

namespace strata::compressors {

namespace {

constexpr std::uint32_t k_max_original_size = 1U << 30;

int zlib_level(const level& lvl) {
  if (const auto* exact = std::get_if<exact_level>(&lvl)) {
    return std::clamp(exact->code, Z_BEST_SPEED, Z_BEST_COMPRESSION);
  }
  switch (std::get<preset>(lvl)) {
    case preset::minimum:
      return Z_BEST_SPEED;
    case preset::medium:
      return 6;
    case preset::maximum:
      return Z_BEST_COMPRESSION;
  }
  return Z_DEFAULT_COMPRESSION;
}

// zlib counts in uInt; everything handed to it here is bounded well below that.
uInt as_uint(std::size_t n) { return static_cast<uInt>(n); }

Bytef* as_bytef(const std::uint8_t* p) { return const_cast<Bytef*>(reinterpret_cast<const Bytef*>(p)); }

class ZlibCompressor final : public Compressor {
 public:
  [[nodiscard]] method id() const override { return method::zlib; }

  // Layout: [deflate stream][u32 le original length].
  result<byte_vector> compress(bytes_view input, const level& lvl, std::optional<bytes_view> dictionary) const override {
    if (input.size() > k_max_original_size) {
      return make_error(stage::compression,
                        error_code::compress_failed,
                        "zlib input of {} bytes exceeds {}",
                        input.size(),
                        k_max_original_size);
    }

    z_stream zs{};
    if (deflateInit(&zs, zlib_level(lvl)) != Z_OK) {
      return make_error(stage::compression, error_code::compress_failed, "deflateInit failed");
    }
    if (dictionary && deflateSetDictionary(&zs, as_bytef(dictionary->data()), as_uint(dictionary->size())) != Z_OK) {
      deflateEnd(&zs);
      return make_error(stage::compression, error_code::compress_failed, "deflateSetDictionary failed");
    }

    byte_vector out(deflateBound(&zs, static_cast<uLong>(input.size())));
    zs.next_in = as_bytef(input.data());
    zs.avail_in = as_uint(input.size());
    zs.next_out = out.data();
    zs.avail_out = as_uint(out.size());
    const int rc = deflate(&zs, Z_FINISH);
    const std::size_t written = zs.total_out;
    deflateEnd(&zs);
    if (rc != Z_STREAM_END) {
      return make_error(stage::compression, error_code::compress_failed, "deflate returned {}", rc);
    }

    out.resize(written);
    TailWriter(out).write_u32_le(static_cast<std::uint32_t>(input.size()));
    return out;
  }

  result<byte_vector> decompress(TailReader& tail, std::optional<bytes_view> dictionary) const override {
    auto original_size = tail.read_u32_le();
    if (!original_size) {
      return tl::make_unexpected(at_stage(std::move(original_size.error()), stage::compression));
    }
    if (*original_size > k_max_original_size) {
      return make_error(stage::compression,
                        error_code::decompress_failed,
                        "zlib stream announces {} bytes, limit is {}",
                        *original_size,
                        k_max_original_size);
    }

    const bytes_view stream = tail.remaining();
    byte_vector out(*original_size);

    z_stream zs{};
    if (inflateInit(&zs) != Z_OK) {
      return make_error(stage::compression, error_code::decompress_failed, "inflateInit failed");
    }
    // inflate rejects a null output pointer even when nothing is to be written.
    std::uint8_t sink = 0;
    zs.next_in = as_bytef(stream.data());
    zs.avail_in = as_uint(stream.size());
    zs.next_out = out.empty() ? &sink : out.data();
    zs.avail_out = as_uint(out.size());

    int rc = inflate(&zs, Z_FINISH);
    if (rc == Z_NEED_DICT) {
      if (!dictionary) {
        inflateEnd(&zs);
        return make_error(stage::compression,
                          error_code::decompress_failed,
                          "zlib stream was compressed with a dictionary and none was supplied");
      }
      if (inflateSetDictionary(&zs, as_bytef(dictionary->data()), as_uint(dictionary->size())) != Z_OK) {
        inflateEnd(&zs);
        return make_error(stage::compression, error_code::decompress_failed, "zlib dictionary does not match stream");
      }
      rc = inflate(&zs, Z_FINISH);
    }
    const std::size_t written = zs.total_out;
    const std::size_t unread = zs.avail_in;
    inflateEnd(&zs);

    if (rc != Z_STREAM_END || written != out.size() || unread != 0) {
      return make_error(stage::compression,
                        error_code::decompress_failed,
                        "inflate returned {} after {} of {} bytes",
                        rc,
                        written,
                        out.size());
    }
    return out;
  }
};

}  // namespace

std::unique_ptr<Compressor> make_zlib() { return std::make_unique<ZlibCompressor>(); }

}  // namespace strata::compressors
