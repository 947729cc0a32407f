#pragma once

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include "strata/codec.hpp"
#include "strata/config.hpp"
#include "strata/error.hpp"
#include "strata/log.hpp"
#include "strata/pipeline.hpp"
#include "strata/store.hpp"

namespace strata {

// How values of one table are encoded. Keys only go through serialization so
// that their stored order stays meaningful.
struct table_options {
  type_config value{};
  bytes_view key{};
  std::optional<bytes_view> dictionary{};
};

enum class bound_kind : std::uint8_t { unbounded, included, excluded };

template <typename K>
struct bound {
  bound_kind kind{bound_kind::unbounded};
  K key{};

  static bound unbounded() { return {}; }
  static bound included(K key) { return {bound_kind::included, std::move(key)}; }
  static bound excluded(K key) { return {bound_kind::excluded, std::move(key)}; }
};

template <typename K>
struct key_range {
  bound<K> lower{};
  bound<K> upper{};

  static key_range all() { return {}; }

  // [first, last)
  static key_range half_open(K first, K last) {
    return {bound<K>::included(std::move(first)), bound<K>::excluded(std::move(last))};
  }

  // [first, last]
  static key_range closed(K first, K last) {
    return {bound<K>::included(std::move(first)), bound<K>::included(std::move(last))};
  }

  static key_range from(K first) { return {bound<K>::included(std::move(first)), bound<K>::unbounded()}; }
};

namespace detail {

inline int compare_bytes(bytes_view lhs, bytes_view rhs) {
  const std::size_t common = std::min(lhs.size(), rhs.size());
  const int c = common == 0 ? 0 : std::memcmp(lhs.data(), rhs.data(), common);
  if (c != 0) {
    return c;
  }
  if (lhs.size() == rhs.size()) {
    return 0;
  }
  return lhs.size() < rhs.size() ? -1 : 1;
}

// A bound on serialized keys.
struct byte_bound {
  bound_kind kind{bound_kind::unbounded};
  byte_vector key;

  // True when `candidate` lies on the allowed side of a lower bound.
  [[nodiscard]] bool admits_from_below(bytes_view candidate) const {
    if (kind == bound_kind::unbounded) {
      return true;
    }
    const int c = compare_bytes(candidate, key);
    return kind == bound_kind::included ? c >= 0 : c > 0;
  }

  [[nodiscard]] bool admits_from_above(bytes_view candidate) const {
    if (kind == bound_kind::unbounded) {
      return true;
    }
    const int c = compare_bytes(candidate, key);
    return kind == bound_kind::included ? c <= 0 : c < 0;
  }
};

template <typename K>
result<byte_vector> encode_key(const K& key) {
  auto bytes = codec<K>::encode(key);
  if (!bytes) {
    return tl::make_unexpected(at_stage(std::move(bytes.error()), stage::serialization));
  }
  return bytes;
}

template <typename K>
result<byte_bound> encode_bound(const bound<K>& b) {
  if (b.kind == bound_kind::unbounded) {
    return byte_bound{};
  }
  auto bytes = encode_key(b.key);
  if (!bytes) {
    return tl::make_unexpected(std::move(bytes.error()));
  }
  return byte_bound{b.kind, std::move(*bytes)};
}

}  // namespace detail

// Lazy sequence of decoded entries between two byte bounds. Walks forward with
// next() and backward with next_back(); the two ends never cross. Must not
// outlive the transaction it reads from.
template <typename K, typename V>
class Entries {
 public:
  using item = result<std::pair<K, V>>;

  Entries(store::ReadTransaction& txn,
          store::table_handle table,
          const Pipeline& pipeline,
          table_options options,
          detail::byte_bound lower,
          detail::byte_bound upper)
      : txn_(&txn),
        table_(std::move(table)),
        pipeline_(&pipeline),
        options_(std::move(options)),
        lower_(std::move(lower)),
        upper_(std::move(upper)) {}

  std::optional<item> next() {
    if (done_) {
      return std::nullopt;
    }
    auto positioned = step(front_, true);
    if (!positioned) {
      return fail(std::move(positioned.error()));
    }
    if (!*positioned || !upper_.admits_from_above(front_->key())) {
      done_ = true;
      return std::nullopt;
    }
    const bytes_view key = front_->key();
    lower_ = detail::byte_bound{bound_kind::excluded, byte_vector(key.begin(), key.end())};
    return decode(key, front_->value());
  }

  std::optional<item> next_back() {
    if (done_) {
      return std::nullopt;
    }
    auto positioned = step(back_, false);
    if (!positioned) {
      return fail(std::move(positioned.error()));
    }
    if (!*positioned || !lower_.admits_from_below(back_->key())) {
      done_ = true;
      return std::nullopt;
    }
    const bytes_view key = back_->key();
    upper_ = detail::byte_bound{bound_kind::excluded, byte_vector(key.begin(), key.end())};
    return decode(key, back_->value());
  }

 private:
  // Moves `cursor` one entry inward, opening and positioning it first if needed.
  result<bool> step(std::unique_ptr<store::Cursor>& cursor, bool forward) {
    if (cursor) {
      return forward ? cursor->next() : cursor->prev();
    }
    auto opened = txn_->open_cursor(table_);
    if (!opened) {
      return tl::make_unexpected(std::move(opened.error()));
    }
    cursor = std::move(*opened);
    return forward ? seek_front(*cursor) : seek_back(*cursor);
  }

  result<bool> seek_front(store::Cursor& cursor) {
    if (lower_.kind == bound_kind::unbounded) {
      return cursor.first();
    }
    auto found = cursor.seek(lower_.key);
    if (!found || !*found || lower_.admits_from_below(cursor.key())) {
      return found;
    }
    return cursor.next();
  }

  result<bool> seek_back(store::Cursor& cursor) {
    if (upper_.kind == bound_kind::unbounded) {
      return cursor.last();
    }
    auto found = cursor.seek(upper_.key);
    if (!found) {
      return found;
    }
    if (!*found) {
      return cursor.last();
    }
    if (upper_.admits_from_above(cursor.key())) {
      return true;
    }
    return cursor.prev();
  }

  item decode(bytes_view key_bytes, bytes_view value_bytes) const {
    auto key = codec<K>::decode(key_bytes);
    if (!key) {
      return tl::make_unexpected(at_stage(std::move(key.error()), stage::serialization));
    }
    auto value = pipeline_->read<V>(Buffer(value_bytes), options_.value, read_args{options_.key, options_.dictionary});
    if (!value) {
      return tl::make_unexpected(std::move(value.error()));
    }
    return std::pair<K, V>(std::move(*key), std::move(*value));
  }

  std::optional<item> fail(error err) {
    done_ = true;
    return item(tl::make_unexpected(std::move(err)));
  }

  store::ReadTransaction* txn_;
  store::table_handle table_;
  const Pipeline* pipeline_;
  table_options options_;
  detail::byte_bound lower_;
  detail::byte_bound upper_;
  std::unique_ptr<store::Cursor> front_;
  std::unique_ptr<store::Cursor> back_;
  bool done_{false};
};

// Typed view of one table inside a transaction. Holds references to the
// transaction and pipeline; both must outlive it.
template <typename K, typename V, typename T_Txn = store::ReadTransaction>
class Table {
 public:
  using key_type = K;
  using mapped_type = V;

  static result<Table> open(T_Txn& txn, std::string_view name, const Pipeline& pipeline, table_options options) {
    auto handle = txn.open_table(name);
    if (!handle) {
      return tl::make_unexpected(std::move(handle.error()));
    }
    return Table(txn, std::move(*handle), pipeline, std::move(options));
  }

  [[nodiscard]] const std::string& name() const { return table_.name; }

  [[nodiscard]] const table_options& options() const { return options_; }

  result<std::optional<V>> get(const K& key) const {
    auto found = get_decoded(key);
    if (!found) {
      return tl::make_unexpected(std::move(found.error()));
    }
    if (!*found) {
      return std::optional<V>{};
    }
    return std::optional<V>(std::move((*found)->value));
  }

  // Like get(), but an absent key is a not_found error.
  result<V> at(const K& key) const {
    auto found = get(key);
    if (!found) {
      return tl::make_unexpected(std::move(found.error()));
    }
    if (!*found) {
      return missing(key);
    }
    return std::move(**found);
  }

  result<bool> contains(const K& key) const {
    auto key_bytes = detail::encode_key(key);
    if (!key_bytes) {
      return tl::make_unexpected(std::move(key_bytes.error()));
    }
    auto raw = txn_->get(table_, *key_bytes);
    if (!raw) {
      return tl::make_unexpected(std::move(raw.error()));
    }
    return raw->has_value();
  }

  // All entries in stored key order. Each call starts a fresh pass.
  Entries<K, V> scan() const {
    return Entries<K, V>(*txn_, table_, *pipeline_, options_, detail::byte_bound{}, detail::byte_bound{});
  }

  result<std::size_t> count() const {
    auto cursor = txn_->open_cursor(table_);
    if (!cursor) {
      return tl::make_unexpected(std::move(cursor.error()));
    }
    std::size_t n = 0;
    auto more = (*cursor)->first();
    while (more && *more) {
      ++n;
      more = (*cursor)->next();
    }
    if (!more) {
      return tl::make_unexpected(std::move(more.error()));
    }
    return n;
  }

 protected:
  Table(T_Txn& txn, store::table_handle table, const Pipeline& pipeline, table_options options)
      : txn_(&txn), table_(std::move(table)), pipeline_(&pipeline), options_(std::move(options)) {}

  result<std::optional<decoded<V>>> get_decoded(const K& key) const {
    auto key_bytes = detail::encode_key(key);
    if (!key_bytes) {
      return tl::make_unexpected(std::move(key_bytes.error()));
    }
    auto raw = txn_->get(table_, *key_bytes);
    if (!raw) {
      return tl::make_unexpected(std::move(raw.error()));
    }
    if (!*raw) {
      return std::optional<decoded<V>>{};
    }
    auto value = pipeline_->read_with_metadata<V>(Buffer(**raw), options_.value, read_arguments());
    if (!value) {
      return tl::make_unexpected(std::move(value.error()));
    }
    return std::optional<decoded<V>>(std::move(*value));
  }

  result<Entries<K, V>> range_entries(const key_range<K>& bounds) const {
    auto lower = detail::encode_bound(bounds.lower);
    if (!lower) {
      return tl::make_unexpected(std::move(lower.error()));
    }
    auto upper = detail::encode_bound(bounds.upper);
    if (!upper) {
      return tl::make_unexpected(std::move(upper.error()));
    }
    return Entries<K, V>(*txn_, table_, *pipeline_, options_, std::move(*lower), std::move(*upper));
  }

  // The lowest (`front`) or highest stored entry.
  result<std::optional<std::pair<K, V>>> edge(bool front) const {
    auto entries = scan();
    auto item = front ? entries.next() : entries.next_back();
    if (!item) {
      return std::optional<std::pair<K, V>>{};
    }
    if (!*item) {
      return tl::make_unexpected(std::move(item->error()));
    }
    return std::optional<std::pair<K, V>>(std::move(**item));
  }

  tl::unexpected<error> missing(const K& key) const {
    auto key_bytes = detail::encode_key(key);
    byte_vector raw = key_bytes ? std::move(*key_bytes) : byte_vector{};
    const std::size_t key_size = raw.size();
    return make_error(stage::table,
                      error_code::not_found,
                      not_found{table_.name, std::move(raw)},
                      "key of {} bytes not found in table '{}'",
                      key_size,
                      table_.name);
  }

  [[nodiscard]] read_args read_arguments() const { return read_args{options_.key, options_.dictionary}; }

  [[nodiscard]] write_args write_arguments() const { return write_args{options_.key, std::nullopt, options_.dictionary}; }

  T_Txn* txn_;
  store::table_handle table_;
  const Pipeline* pipeline_;
  table_options options_;
};

// Writable table. Created on open when missing.
template <typename K, typename V>
class TableMut : public Table<K, V, store::WriteTransaction> {
  using base = Table<K, V, store::WriteTransaction>;

 public:
  static result<TableMut> open(store::WriteTransaction& txn,
                               std::string_view name,
                               const Pipeline& pipeline,
                               table_options options) {
    auto handle = txn.create_table(name);
    if (!handle) {
      return tl::make_unexpected(std::move(handle.error()));
    }
    return TableMut(txn, std::move(*handle), pipeline, std::move(options));
  }

  // Reads like Table::get, and rewrites values that needed parity repair so
  // the damage does not accumulate.
  result<std::optional<V>> get(const K& key) const {
    auto found = this->get_decoded(key);
    if (!found) {
      return tl::make_unexpected(std::move(found.error()));
    }
    if (!*found) {
      return std::optional<V>{};
    }
    if ((*found)->metadata.recovered) {
      STRATA_LOG_INFO("rewriting repaired value in table '{}'", this->name());
      if (auto rewritten = insert(key, (*found)->value); !rewritten) {
        return tl::make_unexpected(std::move(rewritten.error()));
      }
    }
    return std::optional<V>(std::move((*found)->value));
  }

  result<V> at(const K& key) const {
    auto found = get(key);
    if (!found) {
      return tl::make_unexpected(std::move(found.error()));
    }
    if (!*found) {
      return this->missing(key);
    }
    return std::move(**found);
  }

  // Inserts or overwrites.
  result<void> insert(const K& key, const V& value) const {
    auto key_bytes = detail::encode_key(key);
    if (!key_bytes) {
      return tl::make_unexpected(std::move(key_bytes.error()));
    }
    auto stored = this->pipeline_->write(value, this->options_.value, this->write_arguments());
    if (!stored) {
      return tl::make_unexpected(std::move(stored.error()));
    }
    return this->txn_->put(this->table_, *key_bytes, stored->span());
  }

  template <typename T_Range>
  result<void> bulk_insert(const T_Range& entries) const {
    for (const auto& [key, value] : entries) {
      if (auto inserted = insert(key, value); !inserted) {
        return inserted;
      }
    }
    return {};
  }

  // Fails with not_found when the key is absent.
  result<void> remove(const K& key) const {
    auto key_bytes = detail::encode_key(key);
    if (!key_bytes) {
      return tl::make_unexpected(std::move(key_bytes.error()));
    }
    auto erased = this->txn_->erase(this->table_, *key_bytes);
    if (!erased) {
      return tl::make_unexpected(std::move(erased.error()));
    }
    if (!*erased) {
      return this->missing(key);
    }
    return {};
  }

  // Removes the key and returns the value it held, if any.
  result<std::optional<V>> take(const K& key) const {
    auto previous = base::get(key);
    if (!previous || !*previous) {
      return previous;
    }
    if (auto removed = remove(key); !removed) {
      return tl::make_unexpected(std::move(removed.error()));
    }
    return previous;
  }

  // Removes every entry for which `pred(key, value)` is true and returns them
  // in key order. An entry that fails to decode aborts the call before anything
  // is removed.
  template <typename T_Pred>
  result<std::vector<std::pair<K, V>>> extract_if(T_Pred pred) const {
    return extract_between(detail::byte_bound{}, detail::byte_bound{}, pred);
  }

  // Keeps only the entries for which `pred(key, value)` is true.
  template <typename T_Pred>
  result<void> retain(T_Pred pred) const {
    auto dropped = extract_if([&pred](const K& key, const V& value) { return !pred(key, value); });
    if (!dropped) {
      return tl::make_unexpected(std::move(dropped.error()));
    }
    return {};
  }

 protected:
  template <typename T_Pred>
  result<std::vector<std::pair<K, V>>> extract_between(detail::byte_bound lower,
                                                       detail::byte_bound upper,
                                                       T_Pred& pred) const {
    std::vector<std::pair<K, V>> matched;
    {
      // Cursors are closed before the first erase.
      Entries<K, V> entries(
          *this->txn_, this->table_, *this->pipeline_, this->options_, std::move(lower), std::move(upper));
      while (auto item = entries.next()) {
        if (!*item) {
          return tl::make_unexpected(std::move(item->error()));
        }
        const auto& [key, value] = **item;
        if (pred(key, value)) {
          matched.push_back(std::move(**item));
        }
      }
    }
    for (const auto& entry : matched) {
      if (auto removed = remove(entry.first); !removed) {
        return tl::make_unexpected(std::move(removed.error()));
      }
    }
    if (!matched.empty()) {
      STRATA_LOG_DEBUG("extracted {} entries from table '{}'", matched.size(), this->name());
    }
    return matched;
  }

  // Removes and returns the lowest or highest entry.
  result<std::optional<std::pair<K, V>>> pop_edge(bool front) const {
    auto found = this->edge(front);
    if (!found || !*found) {
      return found;
    }
    if (auto removed = remove((*found)->first); !removed) {
      return tl::make_unexpected(std::move(removed.error()));
    }
    return found;
  }


  TableMut(store::WriteTransaction& txn, store::table_handle table, const Pipeline& pipeline, table_options options)
      : base(txn, std::move(table), pipeline, std::move(options)) {}
};

// Tables whose key encoding preserves order additionally answer range queries.
template <ordered_key K, typename V>
class OrderedTable : public Table<K, V> {
  using base = Table<K, V>;

 public:
  static result<OrderedTable> open(store::ReadTransaction& txn,
                                   std::string_view name,
                                   const Pipeline& pipeline,
                                   table_options options) {
    auto handle = txn.open_table(name);
    if (!handle) {
      return tl::make_unexpected(std::move(handle.error()));
    }
    return OrderedTable(txn, std::move(*handle), pipeline, std::move(options));
  }

  // Entries with keys inside `bounds`, ascending via next(), descending via next_back().
  result<Entries<K, V>> range(const key_range<K>& bounds) const { return this->range_entries(bounds); }

  result<std::optional<std::pair<K, V>>> first() const { return this->edge(true); }

  result<std::optional<std::pair<K, V>>> last() const { return this->edge(false); }

 private:
  OrderedTable(store::ReadTransaction& txn, store::table_handle table, const Pipeline& pipeline, table_options options)
      : base(txn, std::move(table), pipeline, std::move(options)) {}
};

template <ordered_key K, typename V>
class OrderedTableMut : public TableMut<K, V> {
  using base = TableMut<K, V>;

 public:
  static result<OrderedTableMut> open(store::WriteTransaction& txn,
                                      std::string_view name,
                                      const Pipeline& pipeline,
                                      table_options options) {
    auto handle = txn.create_table(name);
    if (!handle) {
      return tl::make_unexpected(std::move(handle.error()));
    }
    return OrderedTableMut(txn, std::move(*handle), pipeline, std::move(options));
  }

  result<Entries<K, V>> range(const key_range<K>& bounds) const { return this->range_entries(bounds); }

  result<std::optional<std::pair<K, V>>> first() const { return this->edge(true); }

  result<std::optional<std::pair<K, V>>> last() const { return this->edge(false); }

  // Empty optional on an empty table.
  result<std::optional<std::pair<K, V>>> pop_first() const { return this->pop_edge(true); }

  result<std::optional<std::pair<K, V>>> pop_last() const { return this->pop_edge(false); }

  // extract_if restricted to keys inside `bounds`; entries outside stay put.
  template <typename T_Pred>
  result<std::vector<std::pair<K, V>>> extract_from_if(const key_range<K>& bounds, T_Pred pred) const {
    auto lower = detail::encode_bound(bounds.lower);
    if (!lower) {
      return tl::make_unexpected(std::move(lower.error()));
    }
    auto upper = detail::encode_bound(bounds.upper);
    if (!upper) {
      return tl::make_unexpected(std::move(upper.error()));
    }
    return this->extract_between(std::move(*lower), std::move(*upper), pred);
  }

  // retain restricted to keys inside `bounds`.
  template <typename T_Pred>
  result<void> retain_in(const key_range<K>& bounds, T_Pred pred) const {
    auto dropped = extract_from_if(bounds, [&pred](const K& key, const V& value) { return !pred(key, value); });
    if (!dropped) {
      return tl::make_unexpected(std::move(dropped.error()));
    }
    return {};
  }

 private:
  OrderedTableMut(store::WriteTransaction& txn,
                  store::table_handle table,
                  const Pipeline& pipeline,
                  table_options options)
      : base(txn, std::move(table), pipeline, std::move(options)) {}
};

}  // namespace strata
