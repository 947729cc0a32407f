#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>

#include <mdbx.h>

#include "strata/error.hpp"
#include "strata/store.hpp"

// libmdbx as the sorted store under strata tables.
namespace strata::mdbx {

struct environment_options {
  std::size_t max_tables{64};
  // Upper bound of the memory map; the file grows up to this size.
  std::size_t max_size_bytes{std::size_t{1} << 30};
};

class ReadTxn;
class WriteTxn;

class Environment {
 public:
  static result<Environment> open(const std::filesystem::path& dir, const environment_options& options = {});

  result<ReadTxn> begin_read() const;
  result<WriteTxn> begin_write() const;

 private:
  struct env_deleter {
    void operator()(MDBX_env* env) const { mdbx_env_close(env); }
  };

  explicit Environment(MDBX_env* env) : env_(env) {}

  std::unique_ptr<MDBX_env, env_deleter> env_;
};

namespace detail {

struct txn_deleter {
  void operator()(MDBX_txn* txn) const { mdbx_txn_abort(txn); }
};

using txn_ptr = std::unique_ptr<MDBX_txn, txn_deleter>;

}  // namespace detail

// Read-only snapshot. Aborted on destruction; views it hands out die with it.
class ReadTxn final : public store::ReadTransaction {
 public:
  result<store::table_handle> open_table(std::string_view name) override;
  result<std::optional<bytes_view>> get(const store::table_handle& table, bytes_view key) override;
  result<std::unique_ptr<store::Cursor>> open_cursor(const store::table_handle& table) override;

 private:
  friend class Environment;
  explicit ReadTxn(MDBX_txn* txn) : txn_(txn) {}

  detail::txn_ptr txn_;
};

// The single writer. Changes are discarded unless commit() succeeds.
class WriteTxn final : public store::WriteTransaction {
 public:
  result<store::table_handle> open_table(std::string_view name) override;
  result<std::optional<bytes_view>> get(const store::table_handle& table, bytes_view key) override;
  result<std::unique_ptr<store::Cursor>> open_cursor(const store::table_handle& table) override;

  result<store::table_handle> create_table(std::string_view name) override;
  result<void> put(const store::table_handle& table, bytes_view key, bytes_view value) override;
  result<bool> erase(const store::table_handle& table, bytes_view key) override;

  result<void> commit();
  void abort();

 private:
  friend class Environment;
  explicit WriteTxn(MDBX_txn* txn) : txn_(txn) {}

  detail::txn_ptr txn_;
};

}  // namespace strata::mdbx
