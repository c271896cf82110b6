#ifndef NETFS_RESULT_HPP
#define NETFS_RESULT_HPP

#include <optional>
#include <stdexcept>
#include <utility>
#include <variant>
#include "core/error.hpp"

namespace netfs {

// Tagged success/failure value returned across every public boundary.
// Accessing value() on a failure (or error() on a success) is a
// programming error and throws std::logic_error.
template <typename T>
class Result {
public:
  static Result success(T value) { return Result(std::in_place_index<0>, std::move(value)); }
  static Result failure(Error error) { return Result(std::in_place_index<1>, std::move(error)); }

  Result(Error error) : data_(std::in_place_index<1>, std::move(error)) {}

  bool ok() const { return data_.index() == 0; }
  explicit operator bool() const { return ok(); }

  const T& value() const& { check_value(); return std::get<0>(data_); }
  T& value() & { check_value(); return std::get<0>(data_); }
  T&& value() && { check_value(); return std::get<0>(std::move(data_)); }

  const Error& error() const {
    if (ok()) {
      throw std::logic_error("Result: error() called on a success");
    }
    return std::get<1>(data_);
  }

  T value_or(T fallback) const { return ok() ? std::get<0>(data_) : std::move(fallback); }

private:
  template <std::size_t I, typename U>
  Result(std::in_place_index_t<I> tag, U&& v) : data_(tag, std::forward<U>(v)) {}

  void check_value() const {
    if (!ok()) {
      throw std::logic_error("Result: value() called on a failure: " + std::get<1>(data_).to_string());
    }
  }

  std::variant<T, Error> data_;
};

template <>
class Result<void> {
public:
  static Result success() { return Result(); }
  static Result failure(Error error) { return Result(std::move(error)); }

  Result() = default;
  Result(Error error) : error_(std::move(error)) {}

  bool ok() const { return !error_.has_value(); }
  explicit operator bool() const { return ok(); }

  const Error& error() const {
    if (ok()) {
      throw std::logic_error("Result: error() called on a success");
    }
    return *error_;
  }

private:
  std::optional<Error> error_;
};

} // namespace netfs

#endif // NETFS_RESULT_HPP
