//===----------------------------------------------------------------------===//
//
//                         HLL
//
// exception.h
//
// Identification: src/include/common/exception.h
//
//===----------------------------------------------------------------------===//

#pragma once

#include <iostream>
#include <stdexcept>
#include <string>

namespace hll {

enum class ExceptionType {
  /** Invalid exception type.*/
  INVALID = 0,
  /** Precision outside of the supported range. */
  INVALID_PRECISION = 1,
  /** Sketches of different precision were combined. */
  PRECISION_MISMATCH = 2,
  /** A byte buffer does not match any known sketch layout. */
  MALFORMED_INPUT = 3,
};

class Exception : public std::runtime_error {
 public:
  /**
   * Construct a new Exception instance.
   * @param message The exception message
   * @param print Whether to print the message to stderr
   */
  explicit Exception(const std::string &message, bool print = true)
      : std::runtime_error(message), type_(ExceptionType::INVALID) {
    if (print) {
      std::string exception_message = "Message :: " + message + "\n";
      std::cerr << exception_message;
    }
  }

  /**
   * Construct a new Exception instance with specified type.
   * @param exception_type The exception type
   * @param message The exception message
   * @param print Whether to print the message to stderr
   */
  Exception(ExceptionType exception_type, const std::string &message, bool print = true)
      : std::runtime_error(message), type_(exception_type) {
    if (print) {
      std::string exception_message =
          "\nException Type :: " + ExceptionTypeToString(type_) + ", Message :: " + message + "\n\n";
      std::cerr << exception_message;
    }
  }

  /** @return The type of the exception */
  auto GetType() const -> ExceptionType { return type_; }

  /** @return A human-readable string for the specified exception type */
  static auto ExceptionTypeToString(ExceptionType type) -> std::string {
    switch (type) {
      case ExceptionType::INVALID:
        return "Invalid";
      case ExceptionType::INVALID_PRECISION:
        return "Invalid Precision";
      case ExceptionType::PRECISION_MISMATCH:
        return "Precision Mismatch";
      case ExceptionType::MALFORMED_INPUT:
        return "Malformed Input";
      default:
        return "Unknown";
    }
  }

 private:
  ExceptionType type_;
};

class InvalidPrecisionException : public Exception {
 public:
  InvalidPrecisionException() = delete;
  explicit InvalidPrecisionException(const std::string &msg) : Exception(ExceptionType::INVALID_PRECISION, msg) {}
};

class PrecisionMismatchException : public Exception {
 public:
  PrecisionMismatchException() = delete;
  explicit PrecisionMismatchException(const std::string &msg) : Exception(ExceptionType::PRECISION_MISMATCH, msg) {}
};

class MalformedInputException : public Exception {
 public:
  MalformedInputException() = delete;
  explicit MalformedInputException(const std::string &msg) : Exception(ExceptionType::MALFORMED_INPUT, msg) {}
};

}  // namespace hll
