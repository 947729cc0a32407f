#include <strata.hpp>

#include <array>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string_view>
#include <vector>

struct Frame {
  std::uint32_t id{};
  std::uint64_t captured_ns{};
  std::vector<std::uint8_t> samples;
};

namespace bitsery {

template <typename S>
void serialize(S& s, Frame& f) {
  s.value4b(f.id);
  s.value8b(f.captured_ns);
  s.container1b(f.samples, 1U << 24);
}

}  // namespace bitsery

namespace {

std::uint32_t next_lcg(std::uint32_t& state) {
  state = state * 1664525U + 1013904223U;
  return state;
}

// Slowly drifting signal with some noise, so compressors have something to find.
std::vector<Frame> build_frames(std::size_t count, std::size_t frame_bytes) {
  std::vector<Frame> frames;
  frames.reserve(count);
  std::uint32_t rng = 0xC0FFEE42U;
  for (std::size_t i = 0; i < count; ++i) {
    Frame f;
    f.id = static_cast<std::uint32_t>(i);
    f.captured_ns = static_cast<std::uint64_t>(i) * 1'000'000U;
    f.samples.resize(frame_bytes);
    std::uint8_t level = 128;
    for (auto& s : f.samples) {
      const std::uint32_t r = next_lcg(rng);
      if ((r & 7U) == 0U) {
        level = static_cast<std::uint8_t>(level + ((r >> 8U) & 3U) - 1U);
      }
      s = level;
    }
    frames.push_back(std::move(f));
  }
  return frames;
}

template <typename F>
double measure_seconds(std::size_t iterations, F&& fn) {
  const auto start = std::chrono::steady_clock::now();
  for (std::size_t i = 0; i < iterations; ++i) {
    fn();
  }
  const auto end = std::chrono::steady_clock::now();
  return std::chrono::duration<double>(end - start).count();
}

double throughput_mib_per_s(std::size_t bytes_per_iteration, std::size_t iterations, double seconds) {
  const double total_bytes = static_cast<double>(bytes_per_iteration) * static_cast<double>(iterations);
  const double total_mib = total_bytes / (1024.0 * 1024.0);
  return total_mib / seconds;
}

struct profile {
  std::string_view name;
  strata::type_config config;
};

}  // namespace

int main(int argc, char** argv) {
  std::size_t frames_count = 2000;
  std::size_t frame_bytes = 4096;
  std::size_t iterations = 10;
  if (argc >= 2) {
    frames_count = static_cast<std::size_t>(std::strtoull(argv[1], nullptr, 10));
  }
  if (argc >= 3) {
    frame_bytes = static_cast<std::size_t>(std::strtoull(argv[2], nullptr, 10));
  }
  if (argc >= 4) {
    iterations = static_cast<std::size_t>(std::strtoull(argv[3], nullptr, 10));
  }
  if (frames_count == 0 || iterations == 0) {
    std::cerr << "frames and iterations must be > 0\n";
    return 1;
  }

  const auto frames = build_frames(frames_count, frame_bytes);
  std::array<std::uint8_t, strata::k_key_size> key{};
  for (std::size_t i = 0; i < key.size(); ++i) {
    key[i] = static_cast<std::uint8_t>(i * 7U + 3U);
  }
  const strata::write_args wargs{key, std::nullopt, std::nullopt};
  const strata::read_args rargs{key, std::nullopt};

  const std::array<profile, 5> profiles = {{
      {"plain", strata::type_config::plain()},
      {"compressed", strata::type_config::compressed()},
      {"compressed_max", strata::type_config::compressed(strata::compressors::preset::maximum)},
      {"sealed", strata::type_config::sealed()},
      {"sealed_parity",
       [] {
         auto cfg = strata::type_config::sealed();
         cfg.correction = {strata::direction::both, strata::correctors::preset::standard};
         return cfg;
       }()},
  }};

  const std::array<std::string_view, 2> compressor_names = {"zstd", "zlib"};

  std::size_t raw_bytes = 0;
  for (const auto& f : frames) {
    raw_bytes += strata::codec<Frame>::encode(f)->size();
  }

  std::uint64_t sink = 0;
  std::cout << std::fixed << std::setprecision(2);
  std::cout << "frames=" << frames_count << " frame_bytes=" << frame_bytes << " iterations=" << iterations << "\n";

  for (const auto compressor : compressor_names) {
    auto chosen = strata::selection::from_names({"bitsery", compressor, "aes-gcm", "reed-solomon"});
    assert(chosen.has_value());
    auto backends = strata::Backends::select(*chosen);
    if (!backends) {
      std::cerr << backends.error().message << "\n";
      return 1;
    }
    const strata::Pipeline pipeline(std::move(*backends));

    for (const auto& p : profiles) {
      std::vector<std::vector<std::uint8_t>> stored(frames.size());
      std::size_t stored_bytes = 0;

      const double write_s = measure_seconds(iterations, [&] {
        stored_bytes = 0;
        for (std::size_t i = 0; i < frames.size(); ++i) {
          auto out = pipeline.write(frames[i], p.config, wargs);
          assert(out.has_value());
          const auto bytes = out->span();
          stored[i].assign(bytes.begin(), bytes.end());
          stored_bytes += bytes.size();
        }
      });

      const double read_s = measure_seconds(iterations, [&] {
        for (const auto& s : stored) {
          auto back = pipeline.read<Frame>(strata::Buffer::borrowed(s), p.config, rargs);
          assert(back.has_value());
          sink ^= back->captured_ns ^ back->samples.size();
        }
      });

      std::cout << compressor << "." << p.name << ".stored_bytes=" << stored_bytes
                << " ratio=" << (static_cast<double>(stored_bytes) / static_cast<double>(raw_bytes)) << "\n";
      std::cout << compressor << "." << p.name << ".write_mib_s=" << throughput_mib_per_s(raw_bytes, iterations, write_s)
                << "\n";
      std::cout << compressor << "." << p.name << ".read_mib_s=" << throughput_mib_per_s(raw_bytes, iterations, read_s)
                << "\n";
    }
  }
  std::cout << "checksum_sink=" << sink << "\n";

  return 0;
}
