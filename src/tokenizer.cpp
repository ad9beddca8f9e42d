// -----------------------------------------------------------------------------
// tokenizer.cpp - SCPI lexer
//
// Splits a borrowed byte view into whitespace, mnemonic, number and
// punctuation tokens. The tokenizer never copies and never buffers: a run
// that touches the end of the view is reported as Incomplete and the caller
// retries with more bytes.
//
// API & token table:
//   see include/scpicore/tokenizer.hpp
//
// Usage tests:
//   see tests/test_tokenizer.cpp
// -----------------------------------------------------------------------------
#include "scpicore/tokenizer.hpp"

namespace scpicore {

namespace {

bool accept_whitespace(uint8_t c) { return ascii::is_whitespace(c); }
bool accept_mnemonic(uint8_t c)   { return ascii::is_mnemonic(c); }
bool accept_number(uint8_t c)     { return ascii::is_digit(c) || c == '.'; }

} // namespace

// ---------------------------------------------------------------------------
// next_token()
// Single-byte punctuation is always complete. Runs go through run().
// ---------------------------------------------------------------------------
ScanStatus Tokenizer::next_token(Token& out) {
  if (rest_.empty()) return ScanStatus::Done;     // nothing left to scan

  const uint8_t c = rest_[0];                      // first byte decides the class
  Token::Kind single = Token::Kind::Terminator;
  bool is_single = true;                           // punctuation is one byte long
  switch (c) {
    case ':':  single = Token::Kind::Colon;      break;
    case ',':  single = Token::Kind::Comma;      break;
    case ';':  single = Token::Kind::Semicolon;  break;
    case '?':  single = Token::Kind::Query;      break;
    case '\n': single = Token::Kind::Terminator; break;
    default:   is_single = false;                break;
  }
  if (is_single) {
    out.kind = single;
    out.text = rest_.first(1);                     // token borrows the input
    rest_ = rest_.subspan(1);                      // step over it
    return ScanStatus::Token;
  }

  if (ascii::is_whitespace(c)) return run(Token::Kind::Whitespace, 1, accept_whitespace, out);
  if (accept_number(c))        return run(Token::Kind::Number, 1, accept_number, out);
  if (ascii::is_alpha(c))      return run(Token::Kind::Mnemonic, 1, accept_mnemonic, out);

  if (c == '*') {                                    // common command prefix
    if (rest_.size() < 2) return ScanStatus::Incomplete;          // need the byte after '*'
    if (!ascii::is_alpha(rest_[1])) return ScanStatus::InvalidToken; // "*1", "**"
    return run(Token::Kind::Mnemonic, 2, accept_mnemonic, out);
  }

  return ScanStatus::InvalidToken;                 // '#', quotes, '+', '-': parser's business
}

// ---------------------------------------------------------------------------
// run()
// Extend a token from `start` while `accept` holds. Reaching the end of the
// view means the token might continue in the next read.
// ---------------------------------------------------------------------------
ScanStatus Tokenizer::run(Token::Kind kind, size_t start, bool (*accept)(uint8_t), Token& out) {
  size_t end = start;                              // bytes [0, start) already matched
  while (end < rest_.size() && accept(rest_[end])) ++end;
  if (end == rest_.size()) return ScanStatus::Incomplete;   // may continue in the next read

  out.kind = kind;
  out.text = rest_.first(end);
  rest_ = rest_.subspan(end);
  return ScanStatus::Token;
}

} // namespace scpicore
