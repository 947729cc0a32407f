#pragma once

#include <memory>
#include <string_view>
#include <vector>

#include "strata/compressors.hpp"
#include "strata/correctors.hpp"
#include "strata/descriptor.hpp"
#include "strata/encryptors.hpp"
#include "strata/error.hpp"

namespace strata {

// Requested backends, one list per stage family. Valid only with exactly one
// entry per family.
struct selection {
  std::vector<serializers::method> serializer_methods;
  std::vector<compressors::method> compressor_methods;
  std::vector<encryptors::method> encryptor_methods;
  std::vector<correctors::method> corrector_methods;

  // Appends the backend called `name` to its family ("zstd", "aes-gcm", ...).
  result<void> add(std::string_view name);

  static result<selection> from_names(const std::vector<std::string_view>& names);
};

// The validated backend set. Immutable and shareable across threads.
class Backends {
 public:
  static result<Backends> select(const selection& requested);

  // bitsery + zstd + aes-gcm + reed-solomon.
  static Backends defaults();

  [[nodiscard]] serializers::method serializer() const { return serializer_; }
  [[nodiscard]] const compressors::Compressor& compressor() const { return *compressor_; }
  [[nodiscard]] const encryptors::Encryptor& encryptor() const { return *encryptor_; }
  [[nodiscard]] const correctors::Corrector& corrector() const { return *corrector_; }

 private:
  Backends() = default;

  serializers::method serializer_{serializers::method::bitsery};
  std::shared_ptr<const compressors::Compressor> compressor_;
  std::shared_ptr<const encryptors::Encryptor> encryptor_;
  std::shared_ptr<const correctors::Corrector> corrector_;
};

}  // namespace strata
