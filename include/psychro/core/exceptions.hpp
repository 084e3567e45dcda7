#pragma once
#include <format>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace psychro::core {

class PsychroException : public std::exception {
private:
  std::string message_;
  std::source_location location_;
  std::vector<std::string> call_stack_;

public:
  explicit PsychroException(std::string message, std::source_location location = std::source_location::current())
      : message_(std::move(message)), location_(location) {}

  [[nodiscard]] const char* what() const noexcept override { return message_.c_str(); }

  [[nodiscard]] auto location() const noexcept -> const std::source_location& { return location_; }

  [[nodiscard]] auto message() const noexcept -> const std::string& { return message_; }

  void add_context(std::string context) { call_stack_.push_back(std::move(context)); }

  [[nodiscard]] auto call_stack() const noexcept -> const std::vector<std::string>& { return call_stack_; }

  [[nodiscard]] auto full_message() const -> std::string {
    std::string ctx;
    if (!call_stack_.empty()) {
      ctx.append(" | context: ");
      for (std::size_t i = 0; i < call_stack_.size(); ++i) {
        ctx.append(call_stack_[i]);
        if (i + 1 < call_stack_.size()) {
          ctx.append(" -> ");
        }
      }
    }
    return std::format("{} [{}:{}:{}]{}", message_, location_.file_name(), location_.line(),
                       location_.function_name(), ctx);
  }
};

class ConfigurationError : public PsychroException {
public:
  explicit ConfigurationError(std::string_view message, std::source_location location = std::source_location::current())
      : PsychroException(std::format("Configuration Error: {}", message), location) {}
};

class FileError : public PsychroException {
private:
  std::string filename_;

public:
  explicit FileError(std::string_view message, std::string filename,
                     std::source_location location = std::source_location::current())
      : PsychroException(std::format("File Error ({}): {}", filename, message), location),
        filename_(std::move(filename)) {}

  [[nodiscard]] auto filename() const noexcept -> const std::string& { return filename_; }
};

class ValidationError : public ConfigurationError {
private:
  std::string field_name_;

public:
  explicit ValidationError(std::string_view field_name, std::string_view message,
                           std::source_location location = std::source_location::current())
      : ConfigurationError(std::format("Field '{}': {}", field_name, message), location), field_name_(field_name) {}

  [[nodiscard]] auto field_name() const noexcept -> const std::string& { return field_name_; }
};

// ================================================================================================
// CALCULATION ERRORS
// ================================================================================================

enum class ErrorKind { InvalidArgument, BracketCondition, NumericResult, Convergence };

[[nodiscard]] constexpr auto to_string(ErrorKind kind) noexcept -> std::string_view {
  switch (kind) {
  case ErrorKind::InvalidArgument:
    return "invalid argument";
  case ErrorKind::BracketCondition:
    return "bracket condition";
  case ErrorKind::NumericResult:
    return "numeric result";
  case ErrorKind::Convergence:
    return "convergence";
  }
  return "unknown";
}

/**
 * @brief Error raised by the solver, the property functions and the processes.
 *
 * Derived types only differ by their constructor; they can be stored by value
 * as CalculationError and told apart through kind().
 */
class CalculationError : public PsychroException {
private:
  ErrorKind kind_;

public:
  CalculationError(ErrorKind kind, std::string message, std::source_location location = std::source_location::current())
      : PsychroException(std::move(message), location), kind_(kind) {}

  [[nodiscard]] auto kind() const noexcept -> ErrorKind { return kind_; }
};

class InvalidArgumentError : public CalculationError {
public:
  explicit InvalidArgumentError(std::string_view message,
                                std::source_location location = std::source_location::current())
      : CalculationError(ErrorKind::InvalidArgument, std::format("Invalid Argument: {}", message), location) {}

  InvalidArgumentError(std::string_view quantity, double value, std::string_view constraint,
                       std::source_location location = std::source_location::current())
      : CalculationError(ErrorKind::InvalidArgument,
                         std::format("Invalid Argument: {} = {} violates '{}'", quantity, value, constraint),
                         location) {}
};

class BracketConditionError : public CalculationError {
public:
  explicit BracketConditionError(std::string_view message,
                                 std::source_location location = std::source_location::current())
      : CalculationError(ErrorKind::BracketCondition, std::format("Bracket Condition Error: {}", message), location) {
  }
};

class NumericResultError : public CalculationError {
public:
  explicit NumericResultError(std::string_view message,
                              std::source_location location = std::source_location::current())
      : CalculationError(ErrorKind::NumericResult, std::format("Numeric Error: {}", message), location) {}
};

class ConvergenceError : public CalculationError {
public:
  explicit ConvergenceError(std::string_view message, std::source_location location = std::source_location::current())
      : CalculationError(ErrorKind::Convergence, std::format("Convergence Error: {}", message), location) {}
};

} // namespace psychro::core
