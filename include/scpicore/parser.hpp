/**
 * @file parser.hpp
 * @brief Recursive-descent parser for one SCPI program message unit.
 *
 * @details
 * ## Grammar
 * @code
 *   call            := ws? header '?'? (ws arguments)? ws? terminator
 *   header          := compound-header | common-header
 *   common-header   := '*' mnemonic
 *   compound-header := ':'? mnemonic (':' mnemonic)*
 *   arguments       := argument (ws? ',' ws? argument)*
 *   argument        := characters | decimal | hex | binary | octal
 *                    | 'single quoted' | "double quoted" | arbitrary-block
 *   terminator      := '\n' | ';'
 * @endcode
 *
 * ## Failure kinds
 * Every production reports one of three failures (`ParseError::Kind`):
 * - **Soft**: "this production does not match here". Ordered choices move on
 *   to the next alternative. Carries an optional error, `SyntaxError` when
 *   absent.
 * - **Fatal**: "this matched, but is wrong". `UndefinedHeader` is fatal: once a
 *   mnemonic was read, no other production can rescue the statement.
 * - **Incomplete**: the input ended inside the statement. Always propagates;
 *   the caller keeps the bytes and retries once more data arrived.
 *
 * ## Header context
 * A compound header without a leading ':' is resolved relative to `context`,
 * the header node of the previous statement in the same message (after ';').
 * A leading ':' or a common (`*`) header always resolves from the root.
 *
 * Parsing never allocates. Values in the produced `CommandCall` borrow the
 * input buffer.
 */
#ifndef SCPICORE_PARSER_HPP
#define SCPICORE_PARSER_HPP

#include <stdint.h>
#include "etl/optional.h"
#include "scpicore/ascii.hpp"
#include "scpicore/error.hpp"
#include "scpicore/tree.hpp"
#include "scpicore/value.hpp"

namespace scpicore {

struct ParseError {
  enum class Kind : uint8_t { Soft = 0, Fatal = 1, Incomplete = 2 };

  Kind kind{Kind::Soft};
  etl::optional<Error> error{};

  static ParseError soft() { return ParseError{Kind::Soft, etl::nullopt}; }
  static ParseError soft(Error e) { return ParseError{Kind::Soft, e}; }
  static ParseError fatal(Error e) { return ParseError{Kind::Fatal, e}; }
  static ParseError incomplete() { return ParseError{Kind::Incomplete, etl::nullopt}; }

  /// UndefinedHeader is fatal, anything else soft.
  static ParseError from(Error e);

  /// Error to report for this failure (`SyntaxError` when none was recorded).
  Error reported() const { return error.has_value() ? error.value() : Error(Error::Code::SyntaxError); }
};

/// Empty on success.
using ParseStatus = etl::optional<ParseError>;

/// One parsed program message unit, consumed once by the interpreter.
struct CommandCall {
  const Node* node{nullptr};    ///< resolved header node
  bool        query{false};     ///< header carried '?'
  Arguments   args{};           ///< at most Arguments::MAX_ARGS values
  const Node* header{nullptr};  ///< parent of `node` for compound headers, null for common
  bool        terminated{false};///< ended with '\n' (true) or ';' (false)
};

/**
 * @brief Parse one statement from the front of @p input.
 *
 * @param root    tree root, used for common headers and leading ':'
 * @param context node relative headers start from
 * @param input   advanced past the statement and its terminator on success,
 *                untouched on failure
 * @param call    set to the parsed call, or reset for an empty statement ("\n")
 * @return empty on success, otherwise the failure
 */
ParseStatus parse(const Node& root, const Node& context, Bytes& input,
                  etl::optional<CommandCall>& call);

} // namespace scpicore

#endif // SCPICORE_PARSER_HPP
