#include <strata/backends.hpp>
#include <strata/log.hpp>

namespace strata {

namespace {

template <typename T_Method>
result<T_Method> exactly_one(const std::vector<T_Method>& requested, std::string_view family) {
  if (requested.size() != 1) {
    return make_error(stage::config,
                      error_code::invalid_configuration,
                      "exactly one {} must be selected, found {}",
                      family,
                      requested.size());
  }
  return requested.front();
}

std::unique_ptr<compressors::Compressor> make_compressor(compressors::method m) {
  switch (m) {
    case compressors::method::zstd:
      return compressors::make_zstd();
    case compressors::method::zlib:
      return compressors::make_zlib();
  }
  return nullptr;
}

std::unique_ptr<encryptors::Encryptor> make_encryptor(encryptors::method m) {
  switch (m) {
    case encryptors::method::aes_gcm:
      return encryptors::make_aes_gcm();
    case encryptors::method::chacha20:
      return encryptors::make_chacha20();
  }
  return nullptr;
}

std::unique_ptr<correctors::Corrector> make_corrector(correctors::method m) {
  switch (m) {
    case correctors::method::reed_solomon:
      return correctors::make_reed_solomon();
  }
  return nullptr;
}

}  // namespace

result<void> selection::add(std::string_view name) {
  if (auto m = serializers::parse_method(name)) {
    serializer_methods.push_back(*m);
  } else if (auto c = compressors::parse_method(name)) {
    compressor_methods.push_back(*c);
  } else if (auto e = encryptors::parse_method(name)) {
    encryptor_methods.push_back(*e);
  } else if (auto r = correctors::parse_method(name)) {
    corrector_methods.push_back(*r);
  } else {
    return make_error(stage::config, error_code::invalid_configuration, "unknown backend '{}'", name);
  }
  return {};
}

result<selection> selection::from_names(const std::vector<std::string_view>& names) {
  selection out;
  for (const auto name : names) {
    if (auto added = out.add(name); !added) {
      return tl::make_unexpected(std::move(added.error()));
    }
  }
  return out;
}

result<Backends> Backends::select(const selection& requested) {
  auto serializer = exactly_one(requested.serializer_methods, "serializer");
  if (!serializer) {
    return tl::make_unexpected(std::move(serializer.error()));
  }
  auto compressor = exactly_one(requested.compressor_methods, "compressor");
  if (!compressor) {
    return tl::make_unexpected(std::move(compressor.error()));
  }
  auto encryptor = exactly_one(requested.encryptor_methods, "encryptor");
  if (!encryptor) {
    return tl::make_unexpected(std::move(encryptor.error()));
  }
  auto corrector = exactly_one(requested.corrector_methods, "corrector");
  if (!corrector) {
    return tl::make_unexpected(std::move(corrector.error()));
  }

  Backends out;
  out.serializer_ = *serializer;
  out.compressor_ = make_compressor(*compressor);
  out.encryptor_ = make_encryptor(*encryptor);
  out.corrector_ = make_corrector(*corrector);
  if (!out.compressor_ || !out.encryptor_ || !out.corrector_) {
    return make_error(stage::config, error_code::invalid_configuration, "selected backend has no implementation");
  }

  STRATA_LOG_INFO("backends: serializer={} compressor={} encryptor={} corrector={}",
                  serializers::method_name(*serializer),
                  compressors::method_name(*compressor),
                  encryptors::method_name(*encryptor),
                  correctors::method_name(*corrector));
  return out;
}

Backends Backends::defaults() {
  Backends out;
  out.compressor_ = compressors::make_zstd();
  out.encryptor_ = encryptors::make_aes_gcm();
  out.corrector_ = correctors::make_reed_solomon();
  return out;
}

}  // namespace strata
