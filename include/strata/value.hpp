#pragma once

#include <type_traits>
#include <utility>
#include <variant>

#include "strata/buffer.hpp"

namespace strata {

// A typed value that is either borrowed from the caller or owned.
template <typename T>
class Value {
  static_assert(!std::is_reference_v<T>, "Value<T> holds a value type");

 public:
  using value_type = T;

  static Value borrowed(const T& value) { return Value(&value); }

  static Value owned(T value) { return Value(std::move(value)); }

  [[nodiscard]] bool is_borrowed() const { return std::holds_alternative<const T*>(storage_); }

  [[nodiscard]] const T& get() const {
    if (const auto* ptr = std::get_if<const T*>(&storage_)) {
      return **ptr;
    }
    return std::get<T>(storage_);
  }

  const T& operator*() const { return get(); }

  const T* operator->() const { return &get(); }

  [[nodiscard]] T into_owned() && {
    if (const auto* ptr = std::get_if<const T*>(&storage_)) {
      return **ptr;
    }
    return std::move(std::get<T>(storage_));
  }

 private:
  explicit Value(const T* borrowed) : storage_(borrowed) {}
  explicit Value(T&& owned) : storage_(std::in_place_type<T>, std::move(owned)) {}

  std::variant<const T*, T> storage_;
};

// Payload of a pipeline call whose serialization stage is gated off for that
// direction: the caller supplies or receives serialized bytes instead of T.
template <typename T>
class ValueOrBytes {
 public:
  ValueOrBytes(Value<T> value) : storage_(std::move(value)) {}
  ValueOrBytes(Buffer bytes) : storage_(std::move(bytes)) {}

  [[nodiscard]] bool is_value() const { return std::holds_alternative<Value<T>>(storage_); }

  [[nodiscard]] bool is_bytes() const { return std::holds_alternative<Buffer>(storage_); }

  [[nodiscard]] const Value<T>& value() const { return std::get<Value<T>>(storage_); }

  [[nodiscard]] const Buffer& bytes() const { return std::get<Buffer>(storage_); }

  [[nodiscard]] Value<T> into_value() && { return std::move(std::get<Value<T>>(storage_)); }

  [[nodiscard]] Buffer into_bytes() && { return std::move(std::get<Buffer>(storage_)); }

 private:
  std::variant<Value<T>, Buffer> storage_;
};

}  // namespace strata
