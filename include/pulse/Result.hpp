#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace pulse {

enum class ErrorCode {
  Closed
};

struct Error {
  ErrorCode   code = ErrorCode::Closed;
  std::string message;

  static Error closed() { return Error{ErrorCode::Closed, "ticker already closed"}; }

  std::string describe() const {
    return message;
  }
};

template <typename T>
class Result {
public:
  Result(const T& value) : _value(value) {}
  Result(T&& value) : _value(std::move(value)) {}
  Result(const Error& error) : _value(error) {}
  Result(Error&& error) : _value(std::move(error)) {}

  bool has_value() const { return std::holds_alternative<T>(_value); }
  explicit operator bool() const { return has_value(); }

  T& value() { return std::get<T>(_value); }
  const T& value() const { return std::get<T>(_value); }

  const Error& error() const { return std::get<Error>(_value); }

  T& operator*() { return value(); }
  const T& operator*() const { return value(); }

private:
  std::variant<T, Error> _value;
};

// Status-only form: success or an Error.
template <>
class Result<void> {
public:
  Result() = default;
  Result(const Error& error) : _error(error) {}
  Result(Error&& error) : _error(std::move(error)) {}

  bool has_value() const { return !_error.has_value(); }
  explicit operator bool() const { return has_value(); }

  const Error& error() const { return *_error; }

  bool is(ErrorCode code) const { return _error && _error->code == code; }

private:
  std::optional<Error> _error;
};

} // namespace pulse
