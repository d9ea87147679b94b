#pragma once

#include "strata/common/error.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace strata::common {

class Status {
public:
  static Status success() { return Status(true, Error{}); }
  static Status error(std::string message) {
    return Status(false, Error{.kind = ErrorKind::Internal, .message = std::move(message)});
  }
  static Status error(ErrorKind kind, std::string message) {
    return Status(false, Error{.kind = kind, .message = std::move(message)});
  }
  static Status error(Error error) { return Status(false, std::move(error)); }

  [[nodiscard]] bool ok() const { return ok_; }
  [[nodiscard]] const std::string &error() const { return error_.message; }
  [[nodiscard]] const Error &error_info() const { return error_; }
  [[nodiscard]] ErrorKind kind() const { return error_.kind; }

private:
  Status(bool ok, Error error) : ok_(ok), error_(std::move(error)) {}

  bool ok_;
  Error error_;
};

template <typename T> class Result {
public:
  static Result success(T value) { return Result(true, std::move(value), Error{}); }
  static Result failure(std::string message) {
    return Result(false, std::nullopt,
                  Error{.kind = ErrorKind::Internal, .message = std::move(message)});
  }
  static Result failure(ErrorKind kind, std::string message) {
    return Result(false, std::nullopt, Error{.kind = kind, .message = std::move(message)});
  }
  static Result failure(Error error) { return Result(false, std::nullopt, std::move(error)); }

  [[nodiscard]] bool ok() const { return ok_; }

  [[nodiscard]] const T &value() const {
    if (!ok_) {
      throw std::logic_error("Result has no value: " + error_.message);
    }
    return *value_;
  }

  [[nodiscard]] T &value() {
    if (!ok_) {
      throw std::logic_error("Result has no value: " + error_.message);
    }
    return *value_;
  }

  [[nodiscard]] const std::string &error() const { return error_.message; }
  [[nodiscard]] const Error &error_info() const { return error_; }
  [[nodiscard]] ErrorKind kind() const { return error_.kind; }

private:
  Result(bool ok, std::optional<T> value, Error error)
      : ok_(ok), value_(std::move(value)), error_(std::move(error)) {}

  bool ok_;
  std::optional<T> value_;
  Error error_;
};

template <> class Result<void> {
public:
  static Result success() { return Result(true, Error{}); }
  static Result failure(std::string message) {
    return Result(false, Error{.kind = ErrorKind::Internal, .message = std::move(message)});
  }
  static Result failure(ErrorKind kind, std::string message) {
    return Result(false, Error{.kind = kind, .message = std::move(message)});
  }
  static Result failure(Error error) { return Result(false, std::move(error)); }

  [[nodiscard]] bool ok() const { return ok_; }
  [[nodiscard]] const std::string &error() const { return error_.message; }
  [[nodiscard]] const Error &error_info() const { return error_; }
  [[nodiscard]] ErrorKind kind() const { return error_.kind; }

private:
  Result(bool ok, Error error) : ok_(ok), error_(std::move(error)) {}

  bool ok_;
  Error error_;
};

} // namespace strata::common
