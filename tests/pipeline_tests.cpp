#include "tests/support/fixtures.hpp"

#include <array>
#include <cassert>
#include <cstdint>
#include <vector>

namespace {

using strata::Buffer;
using strata::direction;
using strata::type_config;

constexpr std::array<direction, 4> k_directions = {
    direction::none, direction::on_write, direction::on_read, direction::both};

Buffer step(strata::result<Buffer> r) {
  assert(r.has_value());
  return std::move(*r);
}

std::vector<std::uint8_t> copy_of(const Buffer& b) { return std::vector<std::uint8_t>(b.span().begin(), b.span().end()); }

// Writer side, one stage at a time. A stage that only runs on read in the
// pipeline is applied here by hand, as a caller would.
Buffer write_stages(const strata::Pipeline& p, Buffer b, const type_config& cfg, const strata::write_args& args) {
  b = step(p.compress(std::move(b), cfg.compression, args.dictionary));
  if (cfg.compression.dir == direction::on_read) {
    b = step(p.compress(std::move(b), {direction::both, cfg.compression.level}, args.dictionary));
  }
  b = step(p.encrypt(std::move(b), cfg.encryption, args));
  if (cfg.encryption == direction::on_read) {
    b = step(p.encrypt(std::move(b), direction::both, args));
  }
  b = step(p.protect(std::move(b), cfg.correction));
  if (cfg.correction.dir == direction::on_read) {
    b = step(p.protect(std::move(b), {direction::both, cfg.correction.level}));
  }
  return b;
}

// Reader side; stages the pipeline leaves in place on read are undone by hand.
Buffer read_stages(const strata::Pipeline& p, Buffer b, const type_config& cfg, const strata::read_args& args) {
  if (cfg.correction.dir == direction::on_write) {
    b = step(p.recover(std::move(b), {direction::both, cfg.correction.level}));
  }
  b = step(p.recover(std::move(b), cfg.correction));
  if (cfg.encryption == direction::on_write) {
    b = step(p.decrypt(std::move(b), direction::both, args));
  }
  b = step(p.decrypt(std::move(b), cfg.encryption, args));
  if (cfg.compression.dir == direction::on_write) {
    b = step(p.decompress(std::move(b), {direction::both, cfg.compression.level}, args.dictionary));
  }
  return step(p.decompress(std::move(b), cfg.compression, args.dictionary));
}

void test_direction_matrix(const strata::Pipeline& p) {
  const auto value = fixtures::sample_reading();
  const auto key = fixtures::test_key();
  const strata::write_args wargs{key, std::nullopt, std::nullopt};
  const strata::read_args rargs{key, std::nullopt};
  const auto serialized = strata::codec<Reading>::encode(value);
  assert(serialized.has_value());

  int combinations = 0;
  for (const auto comp : k_directions) {
    for (const auto enc : k_directions) {
      for (const auto corr : k_directions) {
        type_config cfg;
        cfg.compression = {comp, strata::compressors::preset::medium};
        cfg.encryption = enc;
        cfg.correction = {corr, strata::correctors::preset::standard};
        const bool writer_complete = comp != direction::on_read && enc != direction::on_read && corr != direction::on_read;
        const bool reader_complete = comp != direction::on_write && enc != direction::on_write && corr != direction::on_write;

        std::vector<std::uint8_t> stored;
        if (writer_complete) {
          auto whole = p.write(value, cfg, wargs);
          assert(whole.has_value());
          stored = copy_of(*whole);
        } else {
          stored = copy_of(write_stages(p, Buffer::borrowed(*serialized), cfg, wargs));
        }

        if (reader_complete) {
          auto back = p.read<Reading>(Buffer::borrowed(stored), cfg, rargs);
          assert(back.has_value());
          assert(*back == value);
        } else {
          const auto bytes = read_stages(p, Buffer::borrowed(stored), cfg, rargs);
          auto back = strata::codec<Reading>::decode(bytes.span());
          assert(back.has_value());
          assert(*back == value);
        }
        ++combinations;
      }
    }
  }
  assert(combinations == 64);
}

void test_presets(const strata::Pipeline& p) {
  const auto value = fixtures::sample_reading(11);
  const auto key = fixtures::test_key();
  for (const auto& cfg : {type_config::plain(),
                          type_config::compressed(),
                          type_config::compressed(strata::compressors::exact_level{19}),
                          type_config::sealed(),
                          type_config::with_parity(),
                          type_config::with_parity(strata::correctors::preset::maximum)}) {
    auto stored = p.write(value, cfg, {key, std::nullopt, std::nullopt});
    assert(stored.has_value());
    auto back = p.read_with_metadata<Reading>(std::move(*stored), cfg, {key, std::nullopt});
    assert(back.has_value());
    assert(back->value == value);
    assert(!back->metadata.recovered);
  }

  // Plain values are exactly their serialization.
  auto plain = p.write(value, type_config::plain(), {});
  assert(plain.has_value());
  assert(copy_of(*plain) == *strata::codec<Reading>::encode(value));
}

// Compression and encryption both ways, parity only on write.
void test_parity_on_write_scenario(const strata::Pipeline& p) {
  const auto value = fixtures::sample_reading(3);
  const auto key = fixtures::test_key();
  type_config cfg;
  cfg.compression = {direction::both, strata::compressors::preset::medium};
  cfg.encryption = direction::both;
  cfg.correction = {direction::on_write, strata::correctors::preset::basic};
  const strata::correction_config external{direction::both, cfg.correction.level};

  auto written = p.write(value, cfg, {key, std::nullopt, std::nullopt});
  assert(written.has_value());
  const auto stored = copy_of(*written);

  // The pipeline does not strip parity on read.
  auto unstripped = p.read<Reading>(Buffer::borrowed(stored), cfg, {key, std::nullopt});
  assert(!unstripped.has_value());
  assert(unstripped.error().code == strata::error_code::layer_mismatch);
  assert(unstripped.error().where == strata::stage::encryption);

  auto recovered = p.recover(Buffer::borrowed(stored), external);
  assert(recovered.has_value());
  auto back = p.read<Reading>(std::move(*recovered), cfg, {key, std::nullopt});
  assert(back.has_value());
  assert(*back == value);

  // One flipped payload byte is within a single parity shard's reach.
  auto flipped = stored;
  flipped[0] ^= 0xFF;
  auto repaired = p.recover(Buffer::borrowed(flipped), external);
  assert(repaired.has_value());
  assert(repaired->metadata().recovered);
  auto repaired_value = p.read_with_metadata<Reading>(std::move(*repaired), cfg, {key, std::nullopt});
  assert(repaired_value.has_value());
  assert(repaired_value->value == value);
  assert(repaired_value->metadata.recovered);

  // Two damaged shards exceed it.
  strata::TailReader tail{strata::bytes_view(stored)};
  (void)tail.read_descriptor();
  const std::size_t shard_size = *tail.read_u32_le();
  auto beyond = stored;
  beyond[0] ^= 0xFF;
  beyond[shard_size] ^= 0xFF;
  auto lost = p.recover(Buffer::borrowed(beyond), external);
  assert(!lost.has_value());
  assert(lost.error().code == strata::error_code::missing_shard);
  assert(lost.error().get_if<strata::missing_shard>()->index == 0);
}

void test_parity_both_scenario(const strata::Pipeline& p) {
  const auto value = fixtures::sample_reading(4);
  const auto key = fixtures::test_key();
  type_config cfg = type_config::sealed();
  cfg.correction = {direction::both, strata::correctors::preset::basic};

  auto written = p.write(value, cfg, {key, std::nullopt, std::nullopt});
  const auto stored = copy_of(*written);

  auto flipped = stored;
  flipped[1] ^= 0x10;
  auto repaired = p.read_with_metadata<Reading>(Buffer::borrowed(flipped), cfg, {key, std::nullopt});
  assert(repaired.has_value());
  assert(repaired->value == value);
  assert(repaired->metadata.recovered);

  strata::TailReader tail{strata::bytes_view(stored)};
  (void)tail.read_descriptor();
  const std::size_t shard_size = *tail.read_u32_le();
  auto beyond = stored;
  beyond[1] ^= 0x10;
  beyond[shard_size + 1] ^= 0x10;
  auto lost = p.read<Reading>(Buffer::borrowed(beyond), cfg, {key, std::nullopt});
  assert(!lost.has_value());
  assert(lost.error().where == strata::stage::correction);
  assert(lost.error().code == strata::error_code::missing_shard);
}

void test_stage_errors(const strata::Pipeline& p) {
  const auto value = fixtures::sample_reading();
  const auto key = fixtures::test_key();
  const auto other_key = fixtures::test_key(0x99);
  const auto cfg = type_config::sealed();

  auto stored = p.write(value, cfg, {key, std::nullopt, std::nullopt});
  auto wrong_key = p.read<Reading>(stored->to_owned(), cfg, {other_key, std::nullopt});
  assert(!wrong_key.has_value());
  assert(wrong_key.error().where == strata::stage::encryption);
  assert(wrong_key.error().code == strata::error_code::decrypt_failed);

  // Reader expects a layer the writer never applied.
  auto plain_bytes = p.write(value, type_config::plain(), {});
  auto missing_layer = p.read<Reading>(std::move(*plain_bytes), type_config::compressed(), {});
  assert(!missing_layer.has_value());
  assert(missing_layer.error().where == strata::stage::compression);

  const std::vector<std::uint8_t> garbage = {0x00, 0x00, 0x00};
  auto not_a_reading = p.read<Reading>(Buffer::borrowed(garbage), type_config::plain(), {});
  assert(!not_a_reading.has_value());
  assert(not_a_reading.error().where == strata::stage::serialization);
  assert(not_a_reading.error().code == strata::error_code::deserialize_failed);
}

void test_serialization_gating(const strata::Pipeline& p) {
  const auto value = fixtures::sample_reading(21);
  const auto serialized = *strata::codec<Reading>::encode(value);

  // Serialization only on read: the writer hands in bytes.
  type_config read_only = type_config::compressed();
  read_only.serialization = direction::on_read;
  auto rejected = p.write(value, read_only, {});
  assert(!rejected.has_value());
  assert(rejected.error().where == strata::stage::serialization);
  assert(rejected.error().code == strata::error_code::unexpected_payload);

  auto stored = p.write_payload<Reading>(strata::ValueOrBytes<Reading>(Buffer::borrowed(serialized)), read_only, {});
  assert(stored.has_value());
  auto back = p.read<Reading>(std::move(*stored), read_only, {});
  assert(back.has_value() && *back == value);

  // Serialization only on write: the reader gets bytes back.
  type_config write_only = type_config::compressed();
  write_only.serialization = direction::on_write;
  auto written = p.write(value, write_only, {});
  assert(written.has_value());
  auto as_bytes = p.read_payload<Reading>(written->to_owned(), write_only, {});
  assert(as_bytes.has_value());
  assert(as_bytes->is_bytes());
  assert(copy_of(as_bytes->bytes()) == serialized);

  auto typed = p.read<Reading>(std::move(*written), write_only, {});
  assert(!typed.has_value());
  assert(typed.error().code == strata::error_code::unexpected_payload);

  // Both ways: read_payload yields an owned value.
  auto both = p.write(value, type_config::plain(), {});
  auto payload = p.read_payload<Reading>(std::move(*both), type_config::plain(), {});
  assert(payload->is_value());
  assert(!payload->value().is_borrowed());
  assert(payload->value().get() == value);
}

void test_dictionary(const strata::Pipeline& p) {
  const auto value = fixtures::sample_reading(5);
  std::vector<std::uint8_t> dictionary;
  for (std::uint32_t sensor = 0; sensor < 8; ++sensor) {
    const auto sample = *strata::codec<Reading>::encode(fixtures::sample_reading(sensor));
    dictionary.insert(dictionary.end(), sample.begin(), sample.end());
  }
  const auto cfg = type_config::compressed();
  auto stored = p.write(value, cfg, {{}, std::nullopt, strata::bytes_view(dictionary)});
  assert(stored.has_value());
  auto back = p.read<Reading>(std::move(*stored), cfg, {{}, strata::bytes_view(dictionary)});
  assert(back.has_value() && *back == value);
}

}  // namespace

int main() {
  const auto defaults = fixtures::default_pipeline();
  const auto alternate = fixtures::pipeline_for({"bitsery", "zlib", "chacha20", "reed-solomon"});

  for (const auto* p : {&defaults, &alternate}) {
    test_direction_matrix(*p);
    test_presets(*p);
    test_parity_on_write_scenario(*p);
    test_parity_both_scenario(*p);
    test_stage_errors(*p);
    test_serialization_gating(*p);
    test_dictionary(*p);
  }
  return 0;
}
