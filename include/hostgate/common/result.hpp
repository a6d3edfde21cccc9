#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace hostgate::common {

enum class ErrorKind {
  None,
  PermissionDenied,
  NotFound,
  ParseError,
  Timeout,
  ExecutionFailure,
  InvalidArgument,
};

[[nodiscard]] inline const char *error_kind_name(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "none";
  case ErrorKind::PermissionDenied:
    return "permission_denied";
  case ErrorKind::NotFound:
    return "not_found";
  case ErrorKind::ParseError:
    return "parse_error";
  case ErrorKind::Timeout:
    return "timeout";
  case ErrorKind::ExecutionFailure:
    return "execution_failure";
  case ErrorKind::InvalidArgument:
    return "invalid_argument";
  }
  return "unknown";
}

class Status {
public:
  static Status success() { return Status(true, "", ErrorKind::None); }
  static Status error(std::string message, ErrorKind kind = ErrorKind::ExecutionFailure) {
    return Status(false, std::move(message), kind);
  }

  [[nodiscard]] bool ok() const { return ok_; }
  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] ErrorKind kind() const { return kind_; }

private:
  Status(bool ok, std::string error, ErrorKind kind)
      : ok_(ok), error_(std::move(error)), kind_(kind) {}

  bool ok_;
  std::string error_;
  ErrorKind kind_;
};

template <typename T> class Result {
public:
  static Result success(T value) {
    return Result(true, std::move(value), "", ErrorKind::None);
  }
  static Result failure(std::string message, ErrorKind kind = ErrorKind::ExecutionFailure) {
    return Result(false, std::nullopt, std::move(message), kind);
  }

  [[nodiscard]] bool ok() const { return ok_; }

  [[nodiscard]] const T &value() const {
    if (!ok_) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] T &value() {
    if (!ok_) {
      throw std::logic_error("Result has no value: " + error_);
    }
    return *value_;
  }

  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] ErrorKind kind() const { return kind_; }

private:
  Result(bool ok, std::optional<T> value, std::string error, ErrorKind kind)
      : ok_(ok), value_(std::move(value)), error_(std::move(error)), kind_(kind) {}

  bool ok_;
  std::optional<T> value_;
  std::string error_;
  ErrorKind kind_;
};

template <> class Result<void> {
public:
  static Result success() { return Result(true, "", ErrorKind::None); }
  static Result failure(std::string message, ErrorKind kind = ErrorKind::ExecutionFailure) {
    return Result(false, std::move(message), kind);
  }

  [[nodiscard]] bool ok() const { return ok_; }
  [[nodiscard]] const std::string &error() const { return error_; }
  [[nodiscard]] ErrorKind kind() const { return kind_; }

private:
  Result(bool ok, std::string error, ErrorKind kind)
      : ok_(ok), error_(std::move(error)), kind_(kind) {}

  bool ok_;
  std::string error_;
  ErrorKind kind_;
};

} // namespace hostgate::common
