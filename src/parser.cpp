// -----------------------------------------------------------------------------
// parser.cpp - SCPI program message parser
//
// Every production takes the input by reference and only advances it on
// success. Failures come back as ParseStatus (see parser.hpp):
//   soft       -> try the next alternative
//   fatal      -> give up on the statement
//   incomplete -> give up for now, more bytes may fix it
//
// Whitespace and mnemonics are scanned with the Tokenizer; numbers, strings
// and blocks are scanned byte by byte here because their grammar is finer
// than the tokenizer's classes.
// -----------------------------------------------------------------------------
#include "scpicore/parser.hpp"

#include "scpicore/tokenizer.hpp"

namespace scpicore {

ParseError ParseError::from(Error e) {
  if (e.code() == Error::Code::UndefinedHeader) return fatal(e);
  return soft(e);
}

namespace {

constexpr size_t MNEMONIC_MAX = 12;        // IEEE 488.2 program mnemonic limit

using Kind = ParseError::Kind;
using Accept = bool (*)(uint8_t);

ParseStatus ok() { return ParseStatus(); }
ParseStatus soft(Error::Code code) { return ParseError::soft(code); }
ParseStatus incomplete() { return ParseError::incomplete(); }

bool is_soft(const ParseStatus& s) { return s.has_value() && s->kind == Kind::Soft; }

// ---------- lexical helpers ----------

// Exactly one byte `c`.
ParseStatus expect(Bytes& in, uint8_t c, Error::Code mismatch = Error::Code::InvalidCharacter) {
  if (in.empty()) return incomplete();
  if (in[0] != c) return soft(mismatch);
  in = in.subspan(1);
  return ok();
}

// One token of the given kind.
ParseStatus token(Bytes& in, Token::Kind kind, Bytes& text) {
  Tokenizer tok(in);
  Token t;
  switch (tok.next_token(t)) {
    case ScanStatus::Token:
      if (t.kind != kind) return soft(Error::Code::InvalidCharacter);
      text = t.text;
      in = tok.remaining();
      return ok();
    case ScanStatus::InvalidToken:
      return soft(Error::Code::InvalidCharacter);
    case ScanStatus::Incomplete:
    case ScanStatus::Done:
      break;
  }
  return incomplete();
}

ParseStatus whitespace(Bytes& in) {
  Bytes ws;
  return token(in, Token::Kind::Whitespace, ws);
}

// Optional whitespace; sets *skipped when some was consumed.
ParseStatus skip_whitespace(Bytes& in, bool* skipped = nullptr) {
  Bytes trial = in;
  ParseStatus s = whitespace(trial);
  if (!s) {
    in = trial;
    if (skipped) *skipped = true;
    return ok();
  }
  return is_soft(s) ? ok() : s;
}

// Program mnemonic without the common-command '*'.
ParseStatus mnemonic(Bytes& in, Bytes& name) {
  Bytes trial = in;
  if (ParseStatus s = token(trial, Token::Kind::Mnemonic, name)) return s;
  if (name[0] == '*') return soft(Error::Code::InvalidCharacter);
  in = trial;
  return ok();
}

// One or more bytes accepted by `accept`. A run touching the end is incomplete.
ParseStatus digit_run(Bytes& in, Accept accept, Bytes& out) {
  size_t n = 0;
  while (n < in.size() && accept(in[n])) ++n;
  if (n == in.size()) return incomplete();
  if (n == 0) return soft(Error::Code::InvalidCharacter);
  out = in.first(n);
  in = in.subspan(n);
  return ok();
}

// ---------- headers ----------

ParseStatus resolve(const Node& from, Bytes name, const Node*& out) {
  out = from.child(as_text(name));
  if (out) return ok();
  if (name.size() > MNEMONIC_MAX) return ParseError::fatal(Error::Code::ProgramMnemonicTooLong);
  return ParseError::fatal(Error::Code::UndefinedHeader);
}

ParseStatus compound_header(const Node& root, const Node& context, Bytes& in, CommandCall& call) {
  Bytes cur = in;
  if (cur.empty()) return incomplete();

  const Node* node = &context;
  if (cur[0] == ':') {                                 // absolute path
    node = &root;
    cur = cur.subspan(1);
  }

  Bytes name;
  if (ParseStatus s = mnemonic(cur, name)) return s;
  const Node* parent = node;
  if (ParseStatus s = resolve(*parent, name, node)) return s;

  for (;;) {
    if (cur.empty()) return incomplete();
    if (cur[0] != ':') break;
    Bytes next = cur.subspan(1);
    if (ParseStatus s = mnemonic(next, name)) return s;
    const Node* child = nullptr;
    if (ParseStatus s = resolve(*node, name, child)) return s;
    parent = node;
    node = child;
    cur = next;
  }

  call.node = node;
  call.header = parent;
  in = cur;
  return ok();
}

ParseStatus common_header(const Node& root, Bytes& in, CommandCall& call) {
  Bytes cur = in;
  Bytes name;
  if (ParseStatus s = token(cur, Token::Kind::Mnemonic, name)) return s;
  if (name[0] != '*') return soft(Error::Code::InvalidCharacter);

  const Node* node = nullptr;
  if (ParseStatus s = resolve(root, name, node)) return s;

  call.node = node;
  call.header = nullptr;                               // common commands keep the context
  in = cur;
  return ok();
}

ParseStatus header(const Node& root, const Node& context, Bytes& in, CommandCall& call) {
  Bytes trial = in;
  ParseStatus compound = compound_header(root, context, trial, call);
  if (!compound) {
    in = trial;
    return ok();
  }
  if (!is_soft(compound)) return compound;

  trial = in;
  ParseStatus common = common_header(root, trial, call);
  if (!common) {
    in = trial;
    return ok();
  }
  return is_soft(common) ? compound : common;
}

// ---------- arguments ----------

ParseStatus characters(Bytes& in, Value& out) {
  Bytes name;
  if (ParseStatus s = mnemonic(in, name)) return s;
  out = Value(Value::Kind::Characters, name);
  return ok();
}

// [+-](digits[.digits] | .digits)[(E|e)[+-]digits]
ParseStatus decimal(Bytes& in, Value& out) {
  Bytes cur = in;
  Bytes digits;
  if (cur.empty()) return incomplete();
  if (cur[0] == '+' || cur[0] == '-') cur = cur.subspan(1);

  ParseStatus s = digit_run(cur, ascii::is_digit, digits);
  if (s && !is_soft(s)) return s;
  const bool whole = !s;

  bool fraction = false;
  if (cur.empty()) return incomplete();
  if (cur[0] == '.') {
    cur = cur.subspan(1);
    s = digit_run(cur, ascii::is_digit, digits);
    if (s && !is_soft(s)) return s;
    fraction = !s;
  }
  if (!whole && !fraction) return soft(Error::Code::InvalidCharacter);

  if (cur.empty()) return incomplete();
  if (cur[0] == 'E' || cur[0] == 'e') {
    Bytes exp = cur.subspan(1);
    if (exp.empty()) return incomplete();
    if (exp[0] == '+' || exp[0] == '-') exp = exp.subspan(1);
    s = digit_run(exp, ascii::is_digit, digits);
    if (s && !is_soft(s)) return s;
    if (!s) cur = exp;                                 // no digits: 'E' is not ours
  }

  out = Value(Value::Kind::Decimal, in.first(in.size() - cur.size()));
  in = cur;
  return ok();
}

// '#' letter digits, the value keeps only the digits
ParseStatus radix(Bytes& in, Value& out, char letter, Accept accept, Value::Kind kind) {
  Bytes cur = in;
  if (ParseStatus s = expect(cur, '#')) return s;
  if (cur.empty()) return incomplete();
  if (ascii::to_upper(static_cast<char>(cur[0])) != letter) return soft(Error::Code::InvalidCharacter);
  cur = cur.subspan(1);

  Bytes digits;
  if (ParseStatus s = digit_run(cur, accept, digits)) return s;
  out = Value(kind, digits);
  in = cur;
  return ok();
}

ParseStatus hexadecimal(Bytes& in, Value& out) {
  return radix(in, out, 'H', ascii::is_hex_digit, Value::Kind::Hexadecimal);
}
ParseStatus binary(Bytes& in, Value& out) {
  return radix(in, out, 'B', ascii::is_binary_digit, Value::Kind::Binary);
}
ParseStatus octal(Bytes& in, Value& out) {
  return radix(in, out, 'Q', ascii::is_octal_digit, Value::Kind::Octal);
}

// No escaping: the string ends at the next matching quote. A '\n' before it
// ends the program message, so the string can never be closed.
ParseStatus quoted(Bytes& in, Value& out, uint8_t quote) {
  Bytes cur = in;
  if (ParseStatus s = expect(cur, quote)) return s;
  size_t n = 0;
  while (n < cur.size() && cur[n] != quote && cur[n] != '\n') ++n;
  if (n == cur.size()) return incomplete();
  if (cur[n] == '\n') return ParseError::fatal(Error::Code::InvalidStringData);
  out = Value(Value::Kind::String, cur.first(n));
  in = cur.subspan(n + 1);
  return ok();
}

ParseStatus single_quoted(Bytes& in, Value& out) { return quoted(in, out, '\''); }
ParseStatus double_quoted(Bytes& in, Value& out) { return quoted(in, out, '"'); }

// '#' <n: 1..9> <n length digits> <length bytes>
ParseStatus arbitrary(Bytes& in, Value& out) {
  Bytes cur = in;
  if (ParseStatus s = expect(cur, '#')) return s;
  if (cur.empty()) return incomplete();
  const uint8_t d = cur[0];
  if (d < '1' || d > '9') return soft(Error::Code::InvalidCharacter);
  const size_t count_digits = static_cast<size_t>(d - '0');
  cur = cur.subspan(1);

  if (cur.size() < count_digits) return incomplete();
  size_t length = 0;
  for (size_t i = 0; i < count_digits; ++i) {
    if (!ascii::is_digit(cur[i])) return soft(Error::Code::InvalidCharacterInNumber);
    length = length * 10 + static_cast<size_t>(cur[i] - '0');
  }
  cur = cur.subspan(count_digits);

  if (cur.size() < length) return incomplete();
  out = Value(Value::Kind::Arbitrary, cur.first(length));
  in = cur.subspan(length);
  return ok();
}

using Production = ParseStatus (*)(Bytes&, Value&);

constexpr Production ARGUMENT_FORMS[] = {
  characters, decimal, hexadecimal, binary, octal, single_quoted, double_quoted, arbitrary
};

// Ordered choice over ARGUMENT_FORMS.
ParseStatus argument(Bytes& in, Value& out) {
  ParseStatus last = ParseError::soft();
  for (Production form : ARGUMENT_FORMS) {
    ParseStatus s = form(in, out);
    if (!s || !is_soft(s)) return s;
    last = s;
  }
  if (!in.empty() && in[0] == ',') return soft(Error::Code::InvalidSeparator);
  return last;
}

ParseStatus argument_separator(Bytes& in) {
  Bytes cur = in;
  if (ParseStatus s = skip_whitespace(cur)) return s;
  if (ParseStatus s = expect(cur, ',', Error::Code::InvalidSeparator)) return s;
  if (ParseStatus s = skip_whitespace(cur)) return s;
  in = cur;
  return ok();
}

ParseStatus arguments(Bytes& in, Arguments& args) {
  Bytes cur = in;
  Value value;
  if (ParseStatus s = argument(cur, value)) return s;
  args.push(value);

  for (;;) {
    Bytes trial = cur;
    ParseStatus s = argument_separator(trial);
    if (s) {
      if (is_soft(s)) break;                           // no more arguments
      return s;
    }
    if (ParseStatus a = argument(trial, value)) return a;
    if (!args.push(value)) return ParseError::from(Error::Code::UnexpectedNumberOfParameters);
    cur = trial;
  }

  in = cur;
  return ok();
}

} // namespace

// ---------------------------------------------------------------------------
// parse()
// One statement: header, optional '?', optional arguments, terminator.
// A byte that cannot end the statement is reported as InvalidSeparator when
// it follows whitespace or is a comma, InvalidCharacter otherwise.
// ---------------------------------------------------------------------------
ParseStatus parse(const Node& root, const Node& context, Bytes& input,
                  etl::optional<CommandCall>& out) {
  Bytes cur = input;
  if (ParseStatus s = skip_whitespace(cur)) return s;
  if (cur.empty()) return incomplete();

  if (cur[0] == '\n') {                                // blank line
    out.reset();
    input = cur.subspan(1);
    return ok();
  }

  CommandCall call;
  if (ParseStatus s = header(root, context, cur, call)) return s;

  if (cur.empty()) return incomplete();
  if (cur[0] == '?') {
    call.query = true;
    cur = cur.subspan(1);
  }

  Bytes after = cur;
  ParseStatus ws = whitespace(after);
  if (ws && !is_soft(ws)) return ws;
  if (!ws) {
    Bytes args_in = after;
    ParseStatus a = arguments(args_in, call.args);
    if (!a) {
      cur = args_in;
    } else if (!is_soft(a)) {
      return a;
    } else if (after[0] == '\n' || after[0] == ';') {  // trailing whitespace only
      call.args.clear();
      cur = after;
    } else {
      return a;
    }
  }

  bool spaced = false;
  if (ParseStatus s = skip_whitespace(cur, &spaced)) return s;
  if (cur.empty()) return incomplete();

  if (cur[0] == '\n') {
    call.terminated = true;
  } else if (cur[0] == ';') {
    call.terminated = false;
  } else {
    return soft((spaced || cur[0] == ',') ? Error::Code::InvalidSeparator
                                          : Error::Code::InvalidCharacter);
  }

  input = cur.subspan(1);
  out = call;
  return ok();
}

} // namespace scpicore
