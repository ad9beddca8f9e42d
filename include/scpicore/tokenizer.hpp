/**
 * @file tokenizer.hpp
 * @brief Streaming lexer for SCPI program messages.
 *
 * @details
 * The tokenizer walks a borrowed byte view and hands out one token at a time.
 * It never buffers across calls: when a run of bytes reaches the end of the view
 * and could still continue (a mnemonic, a number, a whitespace run), it reports
 * `Incomplete` and leaves the cursor where the run started. The caller prepends
 * those bytes to the next read and scans again.
 *
 * Token classes:
 * | Kind        | Bytes                                         |
 * |-------------|-----------------------------------------------|
 * | Whitespace  | 0x00..0x09, 0x0B..0x20 (run)                  |
 * | Mnemonic    | optional `*`, a letter, then letters/digits/_ |
 * | Number      | `[0-9.]+`                                     |
 * | Colon       | `:`                                           |
 * | Comma       | `,`                                           |
 * | Semicolon   | `;`                                           |
 * | Query       | `?`                                           |
 * | Terminator  | `\n`                                          |
 *
 * `Done` is returned only for an empty view. Any other byte is `InvalidToken`.
 */
#ifndef SCPICORE_TOKENIZER_HPP
#define SCPICORE_TOKENIZER_HPP

#include <stdint.h>
#include "scpicore/ascii.hpp"

namespace scpicore {

struct Token {
  enum class Kind : uint8_t {
    Whitespace,
    Mnemonic,
    Number,
    Colon,
    Comma,
    Semicolon,
    Query,
    Terminator
  };

  Kind  kind{Kind::Terminator};
  Bytes text{};                 ///< bytes of the token, borrowed from the input
};

enum class ScanStatus : uint8_t { Token = 0, Incomplete = 1, InvalidToken = 2, Done = 3 };

class Tokenizer {
public:
  explicit Tokenizer(Bytes input) : rest_(input) {}

  /**
   * @brief Scan the next token.
   * @param out receives the token when the status is `ScanStatus::Token`.
   * @return Token and advances; otherwise leaves the cursor untouched.
   */
  ScanStatus next_token(Token& out);

  /// Bytes not yet consumed (the incomplete tail after `Incomplete`).
  Bytes remaining() const { return rest_; }

private:
  ScanStatus run(Token::Kind kind, size_t start, bool (*accept)(uint8_t), Token& out);

  Bytes rest_;
};

} // namespace scpicore

#endif // SCPICORE_TOKENIZER_HPP
