#pragma once
#include <expected>
#include <stdexcept>
#include <string>
#include <string_view>

namespace geocluster {

enum class ErrorCode { InvalidParameter, InvalidInput, EmptyInput, Io, Parse };

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::InvalidParameter:
      return "InvalidParameter";
    case ErrorCode::InvalidInput:
      return "InvalidInput";
    case ErrorCode::EmptyInput:
      return "EmptyInput";
    case ErrorCode::Io:
      return "Io";
    case ErrorCode::Parse:
      return "Parse";
  }
  return "InvalidInput";
}

struct Error {
  ErrorCode code;
  std::string message;
};

template <typename T> using Result = std::expected<T, Error>;

// =============================================================================
// Exceptions thrown by the core components
// =============================================================================

class InvalidParameter : public std::invalid_argument {
public:
  explicit InvalidParameter(const std::string& what) : std::invalid_argument(what) {}

  [[nodiscard]] virtual ErrorCode code() const noexcept { return ErrorCode::InvalidParameter; }
};

class InvalidInput : public std::invalid_argument {
public:
  explicit InvalidInput(const std::string& what) : std::invalid_argument(what) {}

  [[nodiscard]] virtual ErrorCode code() const noexcept { return ErrorCode::InvalidInput; }
};

class EmptyInput : public InvalidInput {
public:
  explicit EmptyInput(const std::string& what) : InvalidInput(what) {}

  [[nodiscard]] ErrorCode code() const noexcept override { return ErrorCode::EmptyInput; }
};

// =============================================================================
// Exceptions thrown by the io layer
// =============================================================================

// File could not be opened, mapped or written
class IoError : public std::runtime_error {
public:
  explicit IoError(const std::string& what) : std::runtime_error(what) {}

  [[nodiscard]] ErrorCode code() const noexcept { return ErrorCode::Io; }
};

// Document is not valid JSON / msgpack or does not match the expected schema
class ParseError : public std::invalid_argument {
public:
  explicit ParseError(const std::string& what) : std::invalid_argument(what) {}

  [[nodiscard]] ErrorCode code() const noexcept { return ErrorCode::Parse; }
};

}  // namespace geocluster
