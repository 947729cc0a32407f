#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "strata/buffer.hpp"
#include "strata/error.hpp"

// The sorted key-value store strata sits on. Tables and transactions are
// provided by an adapter (see strata/mdbx_store.hpp); strata never creates
// them itself.
namespace strata::store {

// Opaque handle to a named table inside one store.
struct table_handle {
  std::string name;
  std::uint32_t id{};
};

// Positioned over one table, keys in ascending bytewise order. Views returned
// by key()/value() are valid until the cursor moves or the transaction ends.
class Cursor {
 public:
  virtual ~Cursor() = default;

  virtual result<bool> first() = 0;
  virtual result<bool> last() = 0;
  // Positions at the first key >= `key`.
  virtual result<bool> seek(bytes_view key) = 0;
  virtual result<bool> next() = 0;
  virtual result<bool> prev() = 0;

  [[nodiscard]] virtual bool valid() const = 0;
  [[nodiscard]] virtual bytes_view key() const = 0;
  [[nodiscard]] virtual bytes_view value() const = 0;
};

class ReadTransaction {
 public:
  virtual ~ReadTransaction() = default;

  // Fails with not_found when the table does not exist.
  virtual result<table_handle> open_table(std::string_view name) = 0;

  // Bytes borrowed from the store; valid until the transaction ends.
  virtual result<std::optional<bytes_view>> get(const table_handle& table, bytes_view key) = 0;

  virtual result<std::unique_ptr<Cursor>> open_cursor(const table_handle& table) = 0;
};

class WriteTransaction : public ReadTransaction {
 public:
  virtual result<table_handle> create_table(std::string_view name) = 0;

  virtual result<void> put(const table_handle& table, bytes_view key, bytes_view value) = 0;

  // Returns false when the key was absent.
  virtual result<bool> erase(const table_handle& table, bytes_view key) = 0;
};

}  // namespace strata::store
