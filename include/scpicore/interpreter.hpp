/**
 * @file interpreter.hpp
 * @brief Statement loop: parse, execute, report errors, resynchronize.
 *
 * @details
 * ## Loop
 * `run()` takes whatever bytes are available and works through them one
 * statement at a time:
 * @code
 *   Idle -> Parsing -> Executing     -> Idle   (call parsed and executed)
 *                   -> ErrorRecovery -> Idle   (error reported, skip to ';' or '\n')
 * @endcode
 * When a statement is not complete yet, `run()` stops and returns the
 * unconsumed tail. The caller keeps those bytes and passes them again, with
 * whatever arrived since, on the next call.
 *
 * ## Errors
 * Parse errors and handler errors go to the `ErrorHandler`; nothing is written
 * to the wire for them. After a failed statement the interpreter skips to the
 * next ';' or '\n' and carries on. Quoted strings and arbitrary block payloads
 * are skipped as a whole, so a ';' or '\n' inside them does not end the skip.
 * Skipping continues across calls when the terminator has not arrived yet.
 *
 * ## Header context
 * After ';' the next relative header resolves from the parent of the previous
 * compound header. '\n' and any failed statement reset it to the root.
 * Common (`*`) commands leave it unchanged.
 *
 * ## Output
 * Handlers write into the sink. A successful query gets a trailing '\n';
 * commands write nothing on success.
 */
#ifndef SCPICORE_INTERPRETER_HPP
#define SCPICORE_INTERPRETER_HPP

#include <stdint.h>
#include "scpicore/ascii.hpp"
#include "scpicore/error.hpp"
#include "scpicore/error_queue.hpp"
#include "scpicore/interface.hpp"
#include "scpicore/parser.hpp"
#include "scpicore/response.hpp"
#include "scpicore/tree.hpp"

namespace scpicore {

class Interpreter {
public:
  enum class State : uint8_t { Idle = 0, Parsing = 1, Executing = 2, ErrorRecovery = 3 };

  Interpreter(const Node& root, Dispatcher& dispatcher, ErrorHandler& errors);

  template <size_t MaxNodes, size_t MaxCommands>
  Interpreter(Interface<MaxNodes, MaxCommands>& iface, ErrorHandler& errors)
  : Interpreter(iface.root(), iface, errors) {}

  /**
   * @brief Process every complete statement at the front of @p input.
   * @return the unconsumed tail (an incomplete statement), empty otherwise.
   */
  Bytes run(Bytes input, Write& out);

  /// Execute one parsed call; the caller reports the returned error.
  Error execute(const CommandCall& call, Write& out);

  /// Report an error raised outside parsing (e.g. by the processing loop).
  void report(const Error& error) { errors_.handle_error(error); }

  /// Drop the rest of the program message: skip input up to the next '\n'.
  void discard_line();

  /// Back to Idle with the root as header context.
  void reset();

  State state() const { return state_; }
  const Node& context() const { return *context_; }

private:
  // What the recovery scanner is inside of.
  enum class Skip : uint8_t { Text, Quoted, BlockDigitCount, BlockLength, BlockPayload };

  // Skips to just past the next ';' or '\n'. Returns false if input ran out.
  bool skip_statement(Bytes& input);

  // Scanner back to plain text.
  void clear_skip();

  const Node&   root_;
  Dispatcher&   dispatcher_;
  ErrorHandler& errors_;
  const Node*   context_;
  State         state_{State::Idle};

  // Recovery scanner state, kept across calls.
  Skip     skip_{Skip::Text};
  uint8_t  open_quote_{0};      ///< quote byte being skipped, valid in Skip::Quoted
  uint8_t  block_digits_{0};    ///< block length digits still to read
  uint32_t block_left_{0};      ///< block length so far, then payload bytes left
  bool     to_newline_{false};  ///< ';' does not end the skip
};

} // namespace scpicore

#endif // SCPICORE_INTERPRETER_HPP
