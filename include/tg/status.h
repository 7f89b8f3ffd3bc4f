#pragma once

#include <exception>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "tg/error.h"

namespace tg {

// Outcome of a public contract. A zero code means success; anything else is a
// framework code from error.h and the message has already been secret-masked.
class Status {
 public:
  Status() = default;

  [[nodiscard]] static Status Ok() { return Status{}; }
  [[nodiscard]] static Status Fail(ErrorDomain domain, int code, std::string_view message,
                                   Retryability retry = Retryability::kFatal);
  [[nodiscard]] static Status FromError(const Error& err);

  [[nodiscard]] bool ok() const noexcept { return code_ == 0; }
  explicit operator bool() const noexcept { return ok(); }

  [[nodiscard]] ErrorDomain domain() const noexcept { return domain_; }
  [[nodiscard]] int code() const noexcept { return code_; }
  [[nodiscard]] Retryability retryability() const noexcept { return retryability_; }
  [[nodiscard]] const std::string& message() const noexcept { return message_; }
  [[nodiscard]] std::string_view tag() const noexcept { return ok() ? "ok" : ReasonTag(code_); }
  [[nodiscard]] bool IsLockTimeout() const noexcept { return code_ == errors::lock::kTimeout; }

  // "[validation.path_escape] Path escapes base directory"
  [[nodiscard]] std::string ToString() const;

 private:
  ErrorDomain domain_{ErrorDomain::Internal};
  int code_{0};
  Retryability retryability_{Retryability::kFatal};
  std::string message_;
};

inline std::ostream& operator<<(std::ostream& os, const Status& status) {
  return os << status.ToString();
}

template <typename T>
class Result {
 public:
  Result(T value) : value_(std::move(value)) {}
  Result(Status status) : status_(std::move(status)) {
    if (status_.ok()) {
      status_ = Status::Fail(ErrorDomain::Internal, errors::internal::kUnexpected,
                             "Result constructed from success status without value");
    }
  }

  [[nodiscard]] bool ok() const noexcept { return value_.has_value(); }
  explicit operator bool() const noexcept { return ok(); }
  [[nodiscard]] const Status& status() const noexcept { return status_; }

  [[nodiscard]] const T& value() const& {
    if (!value_) {
      throw Error{status_.domain(), status_.code(), status_.message()};
    }
    return *value_;
  }
  [[nodiscard]] T&& value() && {
    if (!value_) {
      throw Error{status_.domain(), status_.code(), status_.message()};
    }
    return std::move(*value_);
  }
  [[nodiscard]] const T& operator*() const& { return value(); }
  [[nodiscard]] const T* operator->() const { return &value(); }

 private:
  std::optional<T> value_;
  Status status_;
};

// Runs fn at a contract boundary and converts any escaping exception into a
// Status. Error keeps its domain and code; anything else maps to Internal.
template <typename Func>
[[nodiscard]] auto CaptureStatus(Func&& fn) noexcept {
  using Ret = std::invoke_result_t<Func&>;
  try {
    if constexpr (std::is_void_v<Ret>) {
      fn();
      return Status::Ok();
    } else {
      return Ret(fn());
    }
  } catch (const Error& err) {
    if constexpr (std::is_void_v<Ret>) {
      return Status::FromError(err);
    } else {
      return Ret(Status::FromError(err));
    }
  } catch (const std::exception& ex) {
    auto status = Status::Fail(ErrorDomain::Internal, errors::internal::kUnexpected, ex.what());
    if constexpr (std::is_void_v<Ret>) {
      return status;
    } else {
      return Ret(std::move(status));
    }
  }
}

} // namespace tg
