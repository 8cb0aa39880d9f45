#pragma once

#include <string>
#include <utility>
#include <variant>

namespace transfmt::core {

// Error enumerations following E.14 (use purpose-designed types as error indicators).
// Only configuration and I/O failures escalate to callers; per-line and per-key anomalies
// are reported as diagnostics and never become errors.

enum class ConfigErrorKind {
  kMissingInputDir,
  kInputDirNotFound,
  kOutputDirUncreatable,
  kUnknownEolStyle,
  kInvalidConfigFile,
};

struct ConfigError {
  ConfigErrorKind kind{ConfigErrorKind::kMissingInputDir};
  std::string message;
};

// IoError identifies the offending file so the caller can report it verbatim.
struct IoError {
  std::string path;
  std::string message;
};

// Result<T, E> follows C++ Core Guidelines E.27: systematic error handling without exceptions.
// This type encodes success (T) or failure (E) explicitly, preventing ignored errors.
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

}  // namespace transfmt::core
