#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <variant>
#include <vector>

namespace strata {

using bytes_view = std::span<const std::uint8_t>;
using byte_vector = std::vector<std::uint8_t>;

struct Metadata {
  // Set when the bytes were reconstructed from parity and should be rewritten.
  bool recovered{false};

  friend bool operator==(const Metadata&, const Metadata&) = default;
};

// Bytes flowing between pipeline stages. Either borrows from the store (valid
// for the owning transaction only) or owns its allocation.
class Buffer {
 public:
  Buffer() : storage_(byte_vector{}) {}

  explicit Buffer(bytes_view borrowed, Metadata metadata = {}) : storage_(borrowed), metadata_(metadata) {}

  explicit Buffer(byte_vector owned, Metadata metadata = {}) : storage_(std::move(owned)), metadata_(metadata) {}

  static Buffer borrowed(bytes_view bytes) { return Buffer(bytes); }

  static Buffer owned(byte_vector bytes) { return Buffer(std::move(bytes)); }

  static Buffer from_parts(Metadata metadata, bytes_view borrowed) { return Buffer(borrowed, metadata); }

  static Buffer from_parts(Metadata metadata, byte_vector owned) { return Buffer(std::move(owned), metadata); }

  [[nodiscard]] bool is_borrowed() const { return std::holds_alternative<bytes_view>(storage_); }

  [[nodiscard]] bool is_owned() const { return !is_borrowed(); }

  [[nodiscard]] std::size_t size() const { return span().size(); }

  [[nodiscard]] bool empty() const { return size() == 0; }

  [[nodiscard]] bytes_view span() const {
    if (const auto* view = std::get_if<bytes_view>(&storage_)) {
      return *view;
    }
    const auto& vec = std::get<byte_vector>(storage_);
    return bytes_view(vec.data(), vec.size());
  }

  [[nodiscard]] const Metadata& metadata() const { return metadata_; }

  Metadata& metadata() { return metadata_; }

  // Splits into metadata and payload. The payload keeps its borrowed/owned form.
  [[nodiscard]] std::pair<Metadata, std::variant<bytes_view, byte_vector>> into_parts() && {
    return {metadata_, std::move(storage_)};
  }

  // Keeps the first `length` bytes. Never copies: a borrowed buffer narrows its
  // view, an owned buffer shrinks its vector.
  void truncate(std::size_t length) {
    if (auto* view = std::get_if<bytes_view>(&storage_)) {
      *view = view->first(std::min(length, view->size()));
    } else {
      auto& vec = std::get<byte_vector>(storage_);
      if (length < vec.size()) {
        vec.resize(length);
      }
    }
  }

  [[nodiscard]] Buffer prefix(std::size_t length) && {
    truncate(length);
    return std::move(*this);
  }

  // Returns a mutable vector, copying only when the buffer is borrowed.
  [[nodiscard]] byte_vector into_vec() && {
    if (auto* view = std::get_if<bytes_view>(&storage_)) {
      return byte_vector(view->begin(), view->end());
    }
    return std::move(std::get<byte_vector>(storage_));
  }

  // Detaches from the store so the buffer may outlive its transaction.
  void make_owned() {
    if (auto* view = std::get_if<bytes_view>(&storage_)) {
      storage_ = byte_vector(view->begin(), view->end());
    }
  }

  [[nodiscard]] Buffer to_owned() const {
    const auto bytes = span();
    return Buffer(byte_vector(bytes.begin(), bytes.end()), metadata_);
  }

 private:
  std::variant<bytes_view, byte_vector> storage_;
  Metadata metadata_{};
};

}  // namespace strata
