#include <strata/compressors.hpp>

#include <algorithm>
#include <memory>

#include <zstd.h>

namespace strata::compressors {

namespace {

// Refuse frames announcing more than this; a corrupt header must not turn
// into a huge allocation.
constexpr unsigned long long k_max_content_size = 1ULL << 30;

struct cctx_deleter {
  void operator()(ZSTD_CCtx* ctx) const { ZSTD_freeCCtx(ctx); }
};

struct dctx_deleter {
  void operator()(ZSTD_DCtx* ctx) const { ZSTD_freeDCtx(ctx); }
};

int zstd_level(const level& lvl) {
  if (const auto* exact = std::get_if<exact_level>(&lvl)) {
    return std::clamp(exact->code, ZSTD_minCLevel(), ZSTD_maxCLevel());
  }
  switch (std::get<preset>(lvl)) {
    case preset::minimum:
      return 1;
    case preset::medium:
      return 3;
    case preset::maximum:
      return 19;
  }
  return ZSTD_CLEVEL_DEFAULT;
}

class ZstdCompressor final : public Compressor {
 public:
  [[nodiscard]] method id() const override { return method::zstd; }

  result<byte_vector> compress(bytes_view input, const level& lvl, std::optional<bytes_view> dictionary) const override {
    std::unique_ptr<ZSTD_CCtx, cctx_deleter> ctx(ZSTD_createCCtx());
    if (!ctx) {
      return make_error(stage::compression, error_code::compress_failed, "ZSTD_createCCtx failed");
    }

    std::size_t rc = ZSTD_CCtx_setParameter(ctx.get(), ZSTD_c_compressionLevel, zstd_level(lvl));
    if (!ZSTD_isError(rc)) {
      // The frame checksum catches a wrong dictionary on the read side.
      rc = ZSTD_CCtx_setParameter(ctx.get(), ZSTD_c_checksumFlag, 1);
    }
    if (!ZSTD_isError(rc) && dictionary) {
      rc = ZSTD_CCtx_loadDictionary(ctx.get(), dictionary->data(), dictionary->size());
    }
    if (ZSTD_isError(rc)) {
      return make_error(stage::compression, error_code::compress_failed, "zstd setup failed: {}", ZSTD_getErrorName(rc));
    }

    byte_vector out(ZSTD_compressBound(input.size()));
    const std::size_t written = ZSTD_compress2(ctx.get(), out.data(), out.size(), input.data(), input.size());
    if (ZSTD_isError(written)) {
      return make_error(stage::compression,
                        error_code::compress_failed,
                        "zstd compression failed: {}",
                        ZSTD_getErrorName(written));
    }
    out.resize(written);
    return out;
  }

  result<byte_vector> decompress(TailReader& tail, std::optional<bytes_view> dictionary) const override {
    const bytes_view frame = tail.remaining();
    const unsigned long long content_size = ZSTD_getFrameContentSize(frame.data(), frame.size());
    if (content_size == ZSTD_CONTENTSIZE_ERROR || content_size == ZSTD_CONTENTSIZE_UNKNOWN) {
      return make_error(stage::compression, error_code::decompress_failed, "not a zstd frame with a known content size");
    }
    if (content_size > k_max_content_size) {
      return make_error(stage::compression,
                        error_code::decompress_failed,
                        "zstd frame announces {} bytes, limit is {}",
                        content_size,
                        k_max_content_size);
    }

    std::unique_ptr<ZSTD_DCtx, dctx_deleter> ctx(ZSTD_createDCtx());
    if (!ctx) {
      return make_error(stage::compression, error_code::decompress_failed, "ZSTD_createDCtx failed");
    }
    if (dictionary) {
      const std::size_t rc = ZSTD_DCtx_loadDictionary(ctx.get(), dictionary->data(), dictionary->size());
      if (ZSTD_isError(rc)) {
        return make_error(stage::compression,
                          error_code::decompress_failed,
                          "zstd dictionary rejected: {}",
                          ZSTD_getErrorName(rc));
      }
    }

    byte_vector out(static_cast<std::size_t>(content_size));
    const std::size_t written = ZSTD_decompressDCtx(ctx.get(), out.data(), out.size(), frame.data(), frame.size());
    if (ZSTD_isError(written)) {
      return make_error(stage::compression,
                        error_code::decompress_failed,
                        "zstd decompression failed: {}",
                        ZSTD_getErrorName(written));
    }
    if (written != out.size()) {
      return make_error(stage::compression,
                        error_code::decompress_failed,
                        "zstd produced {} bytes, frame announced {}",
                        written,
                        out.size());
    }
    return out;
  }
};

}  // namespace

std::unique_ptr<Compressor> make_zstd() { return std::make_unique<ZstdCompressor>(); }

}  // namespace strata::compressors
