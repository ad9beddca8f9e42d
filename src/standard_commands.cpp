// -----------------------------------------------------------------------------
// standard_commands.cpp - SYSTem:ERRor and SYSTem:VERSion handlers
//
// Every handler takes no arguments (arity 0 is enforced by the dispatcher)
// and answers from the error queue it was constructed with.
//
// Registered paths:
//   see include/scpicore/standard_commands.hpp
// -----------------------------------------------------------------------------
#include "scpicore/standard_commands.hpp"

namespace scpicore {

Error StandardCommands::error_next(const Arguments&, Write& out) {
  const etl::optional<Error> next = errors_.pop_error();             // oldest first
  return write_response(out, next.has_value() ? next.value() : Error()); // empty: 0,"No error"
}

Error StandardCommands::error_count(const Arguments&, Write& out) {
  return write_response(out, static_cast<uint32_t>(errors_.error_count())); // queue is untouched
}

Error StandardCommands::version(const Arguments&, Write& out) {
  return write_response(out, Characters{SCPI_VERSION});  // NR2, unquoted ("1999.0")
}

} // namespace scpicore
