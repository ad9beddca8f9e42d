/**
 * @file ascii.hpp
 * @brief Byte views and ASCII character classes shared by the tokenizer, parser and tree.
 *
 * @details
 * Every stage of the interpreter works on borrowed input: a `Bytes` view points
 * into a buffer owned by the caller and never outlives it. The helpers here are
 * tiny, header-only and heap-free so the same code runs on a Linux host and on a
 * microcontroller.
 *
 * Character classes follow IEEE 488.2:
 * - whitespace is 0x00..0x09 and 0x0B..0x20 (newline is the terminator, not whitespace);
 * - mnemonics are built from letters, digits and underscore;
 * - comparisons against header names are ASCII case-insensitive.
 */
#ifndef SCPICORE_ASCII_HPP
#define SCPICORE_ASCII_HPP

#include <stddef.h>
#include <stdint.h>
#include "etl/span.h"
#include "etl/string_view.h"

namespace scpicore {

/// Borrowed view of raw input or output bytes.
using Bytes = etl::span<const uint8_t>;

namespace ascii {

constexpr bool is_whitespace(uint8_t c) { return c <= 0x20 && c != '\n'; }
constexpr bool is_alpha(uint8_t c)      { return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z'); }
constexpr bool is_digit(uint8_t c)      { return c >= '0' && c <= '9'; }
constexpr bool is_lower(uint8_t c)      { return c >= 'a' && c <= 'z'; }
constexpr bool is_alnum(uint8_t c)      { return is_alpha(c) || is_digit(c); }
constexpr bool is_mnemonic(uint8_t c)   { return is_alnum(c) || c == '_'; }
constexpr bool is_hex_digit(uint8_t c) {
  return is_digit(c) || (c >= 'A' && c <= 'F') || (c >= 'a' && c <= 'f');
}
constexpr bool is_octal_digit(uint8_t c)  { return c >= '0' && c <= '7'; }
constexpr bool is_binary_digit(uint8_t c) { return c == '0' || c == '1'; }

constexpr char to_upper(char c) { return (c >= 'a' && c <= 'z') ? char(c - 'a' + 'A') : c; }

/// Case-insensitive equality of two ASCII strings.
inline bool iequals(etl::string_view a, etl::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (to_upper(a[i]) != to_upper(b[i])) return false;
  }
  return true;
}

} // namespace ascii

/// View a byte span as text (no copy).
inline etl::string_view as_text(Bytes bytes) {
  return etl::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

/// View text as a byte span (no copy).
inline Bytes as_bytes(etl::string_view text) {
  return Bytes(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

} // namespace scpicore

#endif // SCPICORE_ASCII_HPP
