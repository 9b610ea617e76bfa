#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace pmm {

// -----------------------------------------------------------------------------
// ErrorKind
// -----------------------------------------------------------------------------
//   External         - transport/auth/logic error raised by an exchange
//                      collaborator (ExternalCallFailure).
//   NotFound         - the referenced order or instrument is not known
//                      locally.
//   InvalidArgument  - a caller-supplied value could not be used even after
//                      clamping.
// -----------------------------------------------------------------------------
enum class ErrorKind {
  External,
  NotFound,
  InvalidArgument,
};

inline const char* toString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::External:        return "External";
    case ErrorKind::NotFound:        return "NotFound";
    case ErrorKind::InvalidArgument: return "InvalidArgument";
  }
  return "Unknown";
}

struct Error {
  ErrorKind kind{ErrorKind::External};
  std::string message;
};

// -----------------------------------------------------------------------------
// Result<T> - success value or Error
// -----------------------------------------------------------------------------
//
// @brief  Discriminated return type for every operation that touches an
//         exchange collaborator.
//
// @details
// The core never lets a collaborator exception unwind into the Strategy
// Loop. Each call site catches, converts to an Error and returns it here;
// the caller inspects ok() and decides whether the failure is retryable.
//
// Backed by std::variant so a Result is a plain value: cheap to move, no
// heap allocation beyond what T and the message need.
//
// value() and error() throw std::logic_error when called on the wrong
// alternative. That is a programming error in the caller, not a runtime
// condition.
// -----------------------------------------------------------------------------
template <typename T>
class Result {
 public:
  Result(T value) : storage_(std::move(value)) {}      // NOLINT(google-explicit-constructor)
  Result(Error error) : storage_(std::move(error)) {}  // NOLINT(google-explicit-constructor)

  static Result failure(ErrorKind kind, std::string message) {
    return Result(Error{kind, std::move(message)});
  }

  bool ok() const { return std::holds_alternative<T>(storage_); }
  explicit operator bool() const { return ok(); }

  const T& value() const {
    if (!ok()) {
      throw std::logic_error("Result::value() called on error: " +
                             std::get<Error>(storage_).message);
    }
    return std::get<T>(storage_);
  }

  T& value() {
    if (!ok()) {
      throw std::logic_error("Result::value() called on error: " +
                             std::get<Error>(storage_).message);
    }
    return std::get<T>(storage_);
  }

  const Error& error() const {
    if (ok()) {
      throw std::logic_error("Result::error() called on success");
    }
    return std::get<Error>(storage_);
  }

 private:
  std::variant<T, Error> storage_;
};

}  // namespace pmm
