#include <strata/log.hpp>
#include <strata/mdbx_store.hpp>

#include <string>

namespace strata::mdbx {

namespace {

tl::unexpected<error> mdbx_failure(int rc, std::string_view context) {
  STRATA_LOG_ERROR("mdbx {} failed: ({}) {}", context, rc, mdbx_strerror(rc));
  return make_error(stage::store, error_code::store_failed, "mdbx {} failed: ({}) {}", context, rc, mdbx_strerror(rc));
}

MDBX_val view(bytes_view bytes) {
  MDBX_val v;
  v.iov_base = const_cast<std::uint8_t*>(bytes.data());
  v.iov_len = bytes.size();
  return v;
}

bytes_view as_bytes(const MDBX_val& v) { return bytes_view(static_cast<const std::uint8_t*>(v.iov_base), v.iov_len); }

result<store::table_handle> open_dbi(MDBX_txn* txn, std::string_view name, MDBX_db_flags_t flags) {
  const std::string owned_name(name);
  MDBX_dbi dbi = 0;
  const int rc = mdbx_dbi_open(txn, owned_name.c_str(), flags, &dbi);
  if (rc == MDBX_NOTFOUND) {
    return make_error(stage::store,
                      error_code::not_found,
                      not_found{owned_name, {}},
                      "table '{}' does not exist",
                      owned_name);
  }
  if (rc != MDBX_SUCCESS) {
    return mdbx_failure(rc, "dbi_open");
  }
  return store::table_handle{owned_name, dbi};
}

result<std::optional<bytes_view>> get_value(MDBX_txn* txn, const store::table_handle& table, bytes_view key) {
  MDBX_val k = view(key);
  MDBX_val data{};
  const int rc = mdbx_get(txn, table.id, &k, &data);
  if (rc == MDBX_NOTFOUND) {
    return std::optional<bytes_view>{};
  }
  if (rc != MDBX_SUCCESS) {
    return mdbx_failure(rc, "get");
  }
  return std::optional<bytes_view>(as_bytes(data));
}

class MdbxCursor final : public store::Cursor {
 public:
  explicit MdbxCursor(MDBX_cursor* cursor) : cursor_(cursor) {}

  result<bool> first() override { return position(MDBX_FIRST); }
  result<bool> last() override { return position(MDBX_LAST); }
  result<bool> next() override { return position(MDBX_NEXT); }
  result<bool> prev() override { return position(MDBX_PREV); }

  result<bool> seek(bytes_view key) override {
    key_ = view(key);
    return position(MDBX_SET_RANGE);
  }

  [[nodiscard]] bool valid() const override { return valid_; }
  [[nodiscard]] bytes_view key() const override { return as_bytes(key_); }
  [[nodiscard]] bytes_view value() const override { return as_bytes(value_); }

 private:
  struct cursor_deleter {
    void operator()(MDBX_cursor* cursor) const { mdbx_cursor_close(cursor); }
  };

  result<bool> position(MDBX_cursor_op op) {
    const int rc = mdbx_cursor_get(cursor_.get(), &key_, &value_, op);
    if (rc == MDBX_NOTFOUND) {
      valid_ = false;
      return false;
    }
    if (rc != MDBX_SUCCESS) {
      valid_ = false;
      return mdbx_failure(rc, "cursor_get");
    }
    valid_ = true;
    return true;
  }

  std::unique_ptr<MDBX_cursor, cursor_deleter> cursor_;
  MDBX_val key_{};
  MDBX_val value_{};
  bool valid_{false};
};

result<std::unique_ptr<store::Cursor>> make_cursor(MDBX_txn* txn, const store::table_handle& table) {
  MDBX_cursor* cursor = nullptr;
  const int rc = mdbx_cursor_open(txn, table.id, &cursor);
  if (rc != MDBX_SUCCESS) {
    return mdbx_failure(rc, "cursor_open");
  }
  return std::unique_ptr<store::Cursor>(std::make_unique<MdbxCursor>(cursor));
}

}  // namespace

result<Environment> Environment::open(const std::filesystem::path& dir, const environment_options& options) {
  MDBX_env* raw = nullptr;
  int rc = mdbx_env_create(&raw);
  if (rc != MDBX_SUCCESS) {
    return mdbx_failure(rc, "env_create");
  }
  Environment env(raw);

  rc = mdbx_env_set_maxdbs(raw, static_cast<MDBX_dbi>(options.max_tables));
  if (rc != MDBX_SUCCESS) {
    return mdbx_failure(rc, "env_set_maxdbs");
  }
  rc = mdbx_env_set_geometry(raw, -1, -1, static_cast<intptr_t>(options.max_size_bytes), -1, -1, -1);
  if (rc != MDBX_SUCCESS) {
    return mdbx_failure(rc, "env_set_geometry");
  }

  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    return make_error(stage::store,
                      error_code::store_failed,
                      "cannot create {}: {}",
                      dir.string(),
                      ec.message());
  }
  rc = mdbx_env_open(raw, dir.string().c_str(), MDBX_ENV_DEFAULTS, 0644);
  if (rc != MDBX_SUCCESS) {
    return mdbx_failure(rc, "env_open");
  }
  return env;
}

result<ReadTxn> Environment::begin_read() const {
  MDBX_txn* txn = nullptr;
  const int rc = mdbx_txn_begin(env_.get(), nullptr, MDBX_TXN_RDONLY, &txn);
  if (rc != MDBX_SUCCESS) {
    return mdbx_failure(rc, "txn_begin(read)");
  }
  return ReadTxn(txn);
}

result<WriteTxn> Environment::begin_write() const {
  MDBX_txn* txn = nullptr;
  const int rc = mdbx_txn_begin(env_.get(), nullptr, MDBX_TXN_READWRITE, &txn);
  if (rc != MDBX_SUCCESS) {
    return mdbx_failure(rc, "txn_begin(write)");
  }
  return WriteTxn(txn);
}

result<store::table_handle> ReadTxn::open_table(std::string_view name) {
  return open_dbi(txn_.get(), name, MDBX_DB_DEFAULTS);
}

result<std::optional<bytes_view>> ReadTxn::get(const store::table_handle& table, bytes_view key) {
  return get_value(txn_.get(), table, key);
}

result<std::unique_ptr<store::Cursor>> ReadTxn::open_cursor(const store::table_handle& table) {
  return make_cursor(txn_.get(), table);
}

result<store::table_handle> WriteTxn::open_table(std::string_view name) {
  return open_dbi(txn_.get(), name, MDBX_DB_DEFAULTS);
}

result<std::optional<bytes_view>> WriteTxn::get(const store::table_handle& table, bytes_view key) {
  return get_value(txn_.get(), table, key);
}

result<std::unique_ptr<store::Cursor>> WriteTxn::open_cursor(const store::table_handle& table) {
  return make_cursor(txn_.get(), table);
}

result<store::table_handle> WriteTxn::create_table(std::string_view name) {
  return open_dbi(txn_.get(), name, MDBX_CREATE);
}

result<void> WriteTxn::put(const store::table_handle& table, bytes_view key, bytes_view value) {
  MDBX_val k = view(key);
  MDBX_val v = view(value);
  const int rc = mdbx_put(txn_.get(), table.id, &k, &v, MDBX_UPSERT);
  if (rc != MDBX_SUCCESS) {
    return mdbx_failure(rc, "put");
  }
  return {};
}

result<bool> WriteTxn::erase(const store::table_handle& table, bytes_view key) {
  MDBX_val k = view(key);
  const int rc = mdbx_del(txn_.get(), table.id, &k, nullptr);
  if (rc == MDBX_NOTFOUND) {
    return false;
  }
  if (rc != MDBX_SUCCESS) {
    return mdbx_failure(rc, "del");
  }
  return true;
}

result<void> WriteTxn::commit() {
  // mdbx frees the transaction whether or not the commit succeeds.
  const int rc = mdbx_txn_commit(txn_.release());
  if (rc != MDBX_SUCCESS) {
    return mdbx_failure(rc, "txn_commit");
  }
  return {};
}

void WriteTxn::abort() { txn_.reset(); }

}  // namespace strata::mdbx
