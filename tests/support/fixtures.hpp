#pragma once

#include <strata.hpp>

#include <array>
#include <cstdint>
#include <string>
#include <vector>

struct Reading {
  std::uint32_t sensor{};
  std::int64_t taken_at{};
  double value{};
  std::string label;
  std::vector<std::uint8_t> raw;

  friend bool operator==(const Reading&, const Reading&) = default;
};

namespace bitsery {

template <typename S>
void serialize(S& s, Reading& r) {
  s.value4b(r.sensor);
  s.value8b(r.taken_at);
  s.value8b(r.value);
  s.text1b(r.label, 256);
  s.container1b(r.raw, 1U << 20);
}

}  // namespace bitsery

namespace fixtures {

inline Reading sample_reading(std::uint32_t sensor = 7) {
  Reading r;
  r.sensor = sensor;
  r.taken_at = -1'700'000'000;
  r.value = 21.5;
  r.label = "boiler room, north wall";
  r.raw.resize(600);
  for (std::size_t i = 0; i < r.raw.size(); ++i) {
    r.raw[i] = static_cast<std::uint8_t>((i * 31U) % 7U);
  }
  return r;
}

inline std::array<std::uint8_t, 32> test_key(std::uint8_t seed = 0x42) {
  std::array<std::uint8_t, 32> key{};
  for (std::size_t i = 0; i < key.size(); ++i) {
    key[i] = static_cast<std::uint8_t>(seed + i * 13U);
  }
  return key;
}

inline strata::Pipeline default_pipeline() { return strata::Pipeline(strata::Backends::defaults()); }

inline strata::Pipeline pipeline_for(std::vector<std::string_view> names) {
  auto chosen = strata::selection::from_names(names);
  auto backends = strata::Backends::select(*chosen);
  return strata::Pipeline(std::move(*backends));
}

}  // namespace fixtures
