#pragma once

#include <utility>
#include <variant>

namespace cuid::core {

// Error enumerations following E.14 (use purpose-designed types as error indicators).

enum class ParseError {
  kInvalidFormat,
  kOverflow,
};

// Result<T, E> follows C++ Core Guidelines E.27: systematic error handling without exceptions.
// Used for recoverable failures only; environment failures are exceptions (see errors.h).
// Usage: return Result<Value, ErrorType>::ok(val) or Result<Value, ErrorType>::err(error).
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::move(value)); }
  static Result err(E error) { return Result(std::move(error)); }

  [[nodiscard]] bool has_value() const { return std::holds_alternative<T>(data_); }
  [[nodiscard]] const T& value() const { return std::get<T>(data_); }
  [[nodiscard]] const E& error() const { return std::get<E>(data_); }

 private:
  explicit Result(T value) : data_(std::move(value)) {}
  explicit Result(E error) : data_(std::move(error)) {}

  std::variant<T, E> data_;
};

}  // namespace cuid::core
