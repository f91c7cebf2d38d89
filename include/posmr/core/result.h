#pragma once

#include <cstddef>
#include <utility>
#include <variant>

namespace posmr::core {

enum class LoadError {
  kInvalidFormat,
  kMissingField,
  kUnreadable,
};

// Result<T, E> carries either a value or an error. Callers must check
// has_value() before reading; there is no implicit conversion to T.
// Usage: return Result<Value, Err>::ok(v) or Result<Value, Err>::err(e).
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
  static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

  [[nodiscard]] bool has_value() const { return data_.index() == 0; }
  [[nodiscard]] const T& value() const { return std::get<0>(data_); }
  [[nodiscard]] T& value() { return std::get<0>(data_); }
  [[nodiscard]] const E& error() const { return std::get<1>(data_); }

 private:
  template <std::size_t I, typename V>
  Result(std::in_place_index_t<I> tag, V&& v) : data_(tag, std::forward<V>(v)) {}

  std::variant<T, E> data_;
};

}  // namespace posmr::core
