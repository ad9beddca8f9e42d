// -----------------------------------------------------------------------------
// error.cpp - SCPI error numbers and messages
//
// The table mirrors the SCPI-99 error list (IEEE 488.2 section 21.8). Order of
// rows does not matter; lookups are linear and the table is small.
//
// API & semantics:
//   see include/scpicore/error.hpp
// -----------------------------------------------------------------------------
#include "scpicore/error.hpp"

#include <string.h>

namespace scpicore {

namespace {

struct ErrorInfo {
  Error::Code code;
  int16_t     number;
  const char* message;
};

using C = Error::Code;

constexpr ErrorInfo ERROR_TABLE[] = {
  {C::None,                         0,    "No error"},
  {C::CommandError,                 -100, "Command error"},
  {C::InvalidCharacter,             -101, "Invalid character"},
  {C::SyntaxError,                  -102, "Syntax error"},
  {C::InvalidSeparator,             -103, "Invalid separator"},
  {C::DataTypeError,                -104, "Data type error"},
  {C::GetNotAllowed,                -105, "GET not allowed"},
  {C::ParameterNotAllowed,          -108, "Parameter not allowed"},
  {C::MissingParameter,             -109, "Missing parameter"},
  {C::CommandHeaderError,           -110, "Command header error"},
  {C::HeaderSeparatorError,         -111, "Header separator error"},
  {C::ProgramMnemonicTooLong,       -112, "Program mnemonic too long"},
  {C::UndefinedHeader,              -113, "Undefined header"},
  {C::HeaderSuffixOutOfRange,       -114, "Header suffix out of range"},
  {C::UnexpectedNumberOfParameters, -115, "Unexpected number of parameters"},
  {C::NumericDataError,             -120, "Numeric data error"},
  {C::InvalidCharacterInNumber,     -121, "Invalid character in number"},
  {C::ExponentTooLarge,             -123, "Exponent too large"},
  {C::TooManyDigits,                -124, "Too many digits"},
  {C::NumericDataNotAllowed,        -128, "Numeric data not allowed"},
  {C::SuffixError,                  -130, "Suffix error"},
  {C::InvalidSuffix,                -131, "Invalid suffix"},
  {C::SuffixTooLong,                -134, "Suffix too long"},
  {C::SuffixNotAllowed,             -138, "Suffix not allowed"},
  {C::CharacterDataError,           -140, "Character data error"},
  {C::InvalidCharacterData,         -141, "Invalid character data"},
  {C::CharacterDataTooLong,         -144, "Character data too long"},
  {C::CharacterDataNotAllowed,      -148, "Character data not allowed"},
  {C::StringDataError,              -150, "String data error"},
  {C::InvalidStringData,            -151, "Invalid string data"},
  {C::StringDataNotAllowed,         -158, "String data not allowed"},
  {C::BlockDataError,               -160, "Block data error"},
  {C::InvalidBlockData,             -161, "Invalid block data"},
  {C::BlockDataNotAllowed,          -168, "Block data not allowed"},
  {C::ExpressionError,              -170, "Expression error"},
  {C::InvalidExpression,            -171, "Invalid expression"},
  {C::ExpressionDataNotAllowed,     -178, "Expression data not allowed"},
  {C::ExecutionError,               -200, "Execution error"},
  {C::InvalidWhileInLocal,          -201, "Invalid while in local"},
  {C::CommandProtected,             -203, "Command protected"},
  {C::TriggerError,                 -210, "Trigger error"},
  {C::ParameterError,               -220, "Parameter error"},
  {C::SettingsConflict,             -221, "Settings conflict"},
  {C::DataOutOfRange,               -222, "Data out of range"},
  {C::TooMuchData,                  -223, "Too much data"},
  {C::IllegalParameterValue,        -224, "Illegal parameter value"},
  {C::OutOfMemory,                  -225, "Out of memory"},
  {C::DataCorruptOrStale,           -230, "Data corrupt or stale"},
  {C::HardwareError,                -240, "Hardware error"},
  {C::DeviceSpecificError,          -300, "Device-specific error"},
  {C::SystemError,                  -310, "System error"},
  {C::StorageFault,                 -320, "Storage fault"},
  {C::SelfTestFailed,               -330, "Self test failed"},
  {C::CalibrationFailed,            -340, "Calibration failed"},
  {C::QueueOverflow,                -350, "Queue overflow"},
  {C::CommunicationError,           -360, "Communication error"},
  {C::InputBufferOverrun,           -363, "Input buffer overrun"},
  {C::TimeoutError,                 -365, "Timeout error"},
  {C::QueryError,                   -400, "Query error"},
  {C::QueryInterrupted,             -410, "Query INTERRUPTED"},
  {C::QueryUnterminated,            -420, "Query UNTERMINATED"},
  {C::QueryDeadlocked,              -430, "Query DEADLOCKED"},
  {C::QueryUnterminatedAfterIndefiniteResponse,
                                    -440, "Query UNTERMINATED after indefinite response"},
};

const ErrorInfo* find_info(Error::Code code) {
  for (const ErrorInfo& info : ERROR_TABLE) {
    if (info.code == code) return &info;
  }
  return nullptr;                        // only Code::Custom lands here
}

} // namespace

// ---------------------------------------------------------------------------
// number()
// Standard codes come from the table, custom codes carry their own number.
// ---------------------------------------------------------------------------
int16_t Error::number() const {
  if (code_ == Code::Custom) return custom_number_;
  const ErrorInfo* info = find_info(code_);
  return info ? info->number : int16_t(0);
}

// ---------------------------------------------------------------------------
// message()
// ---------------------------------------------------------------------------
const char* Error::message() const {
  if (code_ == Code::Custom) return custom_name_ ? custom_name_ : "";
  const ErrorInfo* info = find_info(code_);
  return info ? info->message : "";
}

bool Error::operator==(const Error& other) const {
  if (code_ != other.code_) return false;
  if (code_ != Code::Custom) return true;
  if (custom_number_ != other.custom_number_) return false;
  if (custom_name_ == other.custom_name_) return true;
  if (!custom_name_ || !other.custom_name_) return false;
  return ::strcmp(custom_name_, other.custom_name_) == 0;   // same text, different storage
}

} // namespace scpicore
