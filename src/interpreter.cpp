// -----------------------------------------------------------------------------
// interpreter.cpp - statement loop, dispatch and resynchronization
//
// run() alternates between two modes. Parsing hands one statement at a time
// to parse() and executes it. Recovery runs a small lexer (skip_statement)
// over a failed statement until its terminator, without parsing it again.
// Both modes stop when the input runs out and pick up where they left off on
// the next call.
//
// API & state diagram:
//   see include/scpicore/interpreter.hpp
//
// Usage tests:
//   see tests/test_interpreter.cpp, tests/test_processor.cpp
// -----------------------------------------------------------------------------
#include "scpicore/interpreter.hpp"

namespace scpicore {

Interpreter::Interpreter(const Node& root, Dispatcher& dispatcher, ErrorHandler& errors)
: root_(root), dispatcher_(dispatcher), errors_(errors), context_(&root) {}

// ---------------------------------------------------------------------------
// run()
// ---------------------------------------------------------------------------
Bytes Interpreter::run(Bytes input, Write& out) {
  while (!input.empty()) {
    if (state_ == State::ErrorRecovery) {
      if (!skip_statement(input)) return input;      // everything consumed, still skipping
      state_ = State::Idle;
      continue;
    }

    state_ = State::Parsing;
    etl::optional<CommandCall> call;
    ParseStatus status = parse(root_, *context_, input, call);

    if (status) {
      if (status->kind == ParseError::Kind::Incomplete) {
        state_ = State::Idle;
        return input;                                 // wait for more bytes
      }
      errors_.handle_error(status->reported());
      context_ = &root_;
      state_ = State::ErrorRecovery;                  // input still at statement start
      continue;
    }

    if (!call.has_value()) {                          // blank line
      context_ = &root_;
      state_ = State::Idle;
      continue;
    }

    state_ = State::Executing;
    if (Error e = execute(call.value(), out)) {
      errors_.handle_error(e);
      context_ = &root_;
    } else if (call->terminated) {
      context_ = &root_;
    } else if (call->header) {
      context_ = call->header;                         // ';' keeps the compound path
    }
    state_ = State::Idle;
  }
  return input;
}

// ---------------------------------------------------------------------------
// execute()
// ---------------------------------------------------------------------------
Error Interpreter::execute(const CommandCall& call, Write& out) {
  if (!call.node) return Error::Code::UndefinedHeader;
  const etl::optional<CommandId>& id = call.query ? call.node->query() : call.node->command();
  if (!id.has_value()) return Error::Code::UndefinedHeader;   // e.g. "VOLT?" where only "VOLT" exists

  if (Error e = dispatcher_.execute_command(id.value(), call.args, out)) return e;
  if (call.query) return out.write_char('\n');       // response message terminator
  return Error();                                     // commands answer nothing
}

void Interpreter::discard_line() {
  clear_skip();
  state_ = State::ErrorRecovery;
  to_newline_ = true;
  context_ = &root_;
}

void Interpreter::reset() {
  clear_skip();
  state_ = State::Idle;
  context_ = &root_;
}

void Interpreter::clear_skip() {
  skip_ = Skip::Text;
  open_quote_ = 0;
  block_digits_ = 0;
  block_left_ = 0;
  to_newline_ = false;
}

// ---------------------------------------------------------------------------
// skip_statement()
// A small lexer over the failed statement: quoted strings and definite length
// blocks (#<n><length><payload>) are stepped over whole. State survives across
// calls so a ';' inside a string or block split over two reads is still
// skipped. Anything that does not continue a block header is plain text again.
// ---------------------------------------------------------------------------
bool Interpreter::skip_statement(Bytes& input) {
  for (size_t i = 0; i < input.size(); ++i) {
    const uint8_t c = input[i];

    switch (skip_) {
      case Skip::Quoted:
        if (c == open_quote_) {
          skip_ = Skip::Text;
          continue;
        }
        if (c != '\n') continue;
        break;                                        // a newline always ends the message
      case Skip::BlockDigitCount:
        if (c >= '1' && c <= '9') {
          block_digits_ = static_cast<uint8_t>(c - '0');
          block_left_ = 0;
          skip_ = Skip::BlockLength;
          continue;
        }
        break;                                        // '#H', '#B', '#Q' or '#0': not a block
      case Skip::BlockLength:
        if (ascii::is_digit(c)) {
          block_left_ = block_left_ * 10 + static_cast<uint32_t>(c - '0');
          if (--block_digits_ == 0) skip_ = block_left_ ? Skip::BlockPayload : Skip::Text;
          continue;
        }
        break;
      case Skip::BlockPayload:
        if (--block_left_ == 0) skip_ = Skip::Text;
        continue;                                     // payload bytes are opaque
      case Skip::Text:
        break;
    }

    skip_ = Skip::Text;
    if (c == '"' || c == '\'') {
      open_quote_ = c;
      skip_ = Skip::Quoted;
      continue;
    }
    if (c == '#') {
      skip_ = Skip::BlockDigitCount;
      continue;
    }
    if (c == '\n' || (c == ';' && !to_newline_)) {
      if (c == '\n') context_ = &root_;
      clear_skip();
      input = input.subspan(i + 1);
      return true;
    }
  }
  input = input.subspan(input.size());
  return false;
}

} // namespace scpicore
