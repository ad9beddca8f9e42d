/**
 * @file error.hpp
 * @brief SCPI error model: IEEE 488.2 / SCPI-99 error numbers with their canonical messages.
 *
 * @details
 * ## Role
 * `scpicore::Error` is the one status type used across the interpreter. Parser
 * failures, handler failures and resource failures all end up as an `Error`
 * that the interpreter hands to an `ErrorHandler` (usually the error queue),
 * and that `SYSTem:ERRor?` later renders as `<number>,"<message>"`.
 *
 * ## Status semantics
 * A default-constructed `Error` is code 0, `"No error"`, and means success.
 * `explicit operator bool()` is true only for a real error, so the usual
 * pattern reads:
 * @code
 *   if (scpicore::Error e = args.get(0, volts)) return e;   // propagate
 * @endcode
 *
 * ## Taxonomy
 * - Command errors (-100..-199): raised while parsing a program message.
 * - Execution errors (-200..-299): raised by handlers (range checks, bad values).
 * - Device-specific errors (-300..-399): resource problems such as queue overflow.
 * - Query errors (-400..-499).
 * - `Custom`: application-defined number and name, stored by pointer.
 *
 * Messages are returned verbatim from a static table; no allocation, no copies.
 * Custom error names must point at storage with static lifetime.
 */
#ifndef SCPICORE_ERROR_HPP
#define SCPICORE_ERROR_HPP

#include <stdint.h>

namespace scpicore {

class Error {
public:
  /// Closed set of standard errors; `Custom` carries its own number and name.
  enum class Code : uint8_t {
    None,
    // Command errors
    CommandError,
    InvalidCharacter,
    SyntaxError,
    InvalidSeparator,
    DataTypeError,
    GetNotAllowed,
    ParameterNotAllowed,
    MissingParameter,
    CommandHeaderError,
    HeaderSeparatorError,
    ProgramMnemonicTooLong,
    UndefinedHeader,
    HeaderSuffixOutOfRange,
    UnexpectedNumberOfParameters,
    NumericDataError,
    InvalidCharacterInNumber,
    ExponentTooLarge,
    TooManyDigits,
    NumericDataNotAllowed,
    SuffixError,
    InvalidSuffix,
    SuffixTooLong,
    SuffixNotAllowed,
    CharacterDataError,
    InvalidCharacterData,
    CharacterDataTooLong,
    CharacterDataNotAllowed,
    StringDataError,
    InvalidStringData,
    StringDataNotAllowed,
    BlockDataError,
    InvalidBlockData,
    BlockDataNotAllowed,
    ExpressionError,
    InvalidExpression,
    ExpressionDataNotAllowed,
    // Execution errors
    ExecutionError,
    InvalidWhileInLocal,
    CommandProtected,
    TriggerError,
    ParameterError,
    SettingsConflict,
    DataOutOfRange,
    TooMuchData,
    IllegalParameterValue,
    OutOfMemory,
    DataCorruptOrStale,
    HardwareError,
    // Device-specific errors
    DeviceSpecificError,
    SystemError,
    StorageFault,
    SelfTestFailed,
    CalibrationFailed,
    QueueOverflow,
    CommunicationError,
    InputBufferOverrun,
    TimeoutError,
    // Query errors
    QueryError,
    QueryInterrupted,
    QueryUnterminated,
    QueryDeadlocked,
    QueryUnterminatedAfterIndefiniteResponse,
    Custom
  };

  constexpr Error() = default;

  /// Implicit so handlers can `return Error::Code::DataOutOfRange;`.
  constexpr Error(Code code) : code_(code) {}

  /// Application-defined error. @p name must have static storage duration.
  static constexpr Error custom(int16_t number, const char* name) {
    return Error(number, name);
  }

  constexpr Code code() const { return code_; }

  /// Signed SCPI error number (0 for no error).
  int16_t number() const;

  /// Canonical message text, never null.
  const char* message() const;

  constexpr explicit operator bool() const { return code_ != Code::None; }

  bool operator==(const Error& other) const;
  bool operator!=(const Error& other) const { return !(*this == other); }

private:
  constexpr Error(int16_t number, const char* name)
  : code_(Code::Custom), custom_number_(number), custom_name_(name) {}

  Code        code_{Code::None};
  int16_t     custom_number_{0};      ///< only meaningful for Code::Custom
  const char* custom_name_{nullptr};  ///< only meaningful for Code::Custom
};

} // namespace scpicore

#endif // SCPICORE_ERROR_HPP
