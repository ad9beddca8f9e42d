/**
 * @file value.hpp
 * @brief Typed-but-unconverted SCPI argument values and their conversions.
 *
 * @details
 * The parser only records the lexical form of an argument. A `Value` keeps
 * that form (decimal, hex, bare characters, quoted string, ...) and a view of
 * the raw text in the input buffer. Numeric meaning is decided later, when a
 * handler asks for a concrete type:
 * @code
 *   uint16_t channel;
 *   if (scpicore::Error e = args.get(0, channel)) return e;
 * @endcode
 *
 * @par Conversion rules
 * - Integers and floats: Decimal parses base 10 (mantissa/exponent forms are
 *   accepted for integers when the result is integral), Hexadecimal base 16,
 *   Octal base 8, Binary base 2. Malformed digits give `NumericDataError`,
 *   a value outside the target range gives `DataOutOfRange`, any other
 *   lexical class gives `DataTypeError`.
 * - bool: `ON`, `OFF`, `TRUE`, `FALSE` (any case) or decimal `1`/`0`.
 *   Other character or numeric data gives `IllegalParameterValue`; strings
 *   and blocks give `DataTypeError`.
 * - `etl::string_view`: quoted strings only.
 * - `Characters`: bare character data only.
 * - `Bytes`: arbitrary blocks and quoted strings.
 *
 * Views returned by conversions borrow the input buffer; that buffer must
 * outlive the value.
 */
#ifndef SCPICORE_VALUE_HPP
#define SCPICORE_VALUE_HPP

#include <stddef.h>
#include <stdint.h>
#include "etl/string_view.h"
#include "etl/vector.h"
#include "scpicore/ascii.hpp"
#include "scpicore/error.hpp"

namespace scpicore {

/// Bare (unquoted) character data, e.g. `ON`, `MAXimum`, `1999.0` in a response.
struct Characters {
  etl::string_view text;
};

class Value {
public:
  enum class Kind : uint8_t {
    String,       ///< quoted with ' or ", quotes stripped
    Characters,   ///< bare mnemonic-like text
    Decimal,      ///< [+-]digits[.digits][E[+-]digits]
    Hexadecimal,  ///< digits after #H
    Binary,       ///< digits after #B
    Octal,        ///< digits after #Q
    Arbitrary     ///< payload of a #<n><len> block
  };

  Value() = default;
  Value(Kind kind, Bytes data) : kind_(kind), data_(data) {}

  Kind kind() const { return kind_; }
  Bytes bytes() const { return data_; }
  etl::string_view text() const { return as_text(data_); }

  Error to(bool& out) const;
  Error to(int8_t& out) const;
  Error to(uint8_t& out) const;
  Error to(int16_t& out) const;
  Error to(uint16_t& out) const;
  Error to(int32_t& out) const;
  Error to(uint32_t& out) const;
  Error to(int64_t& out) const;
  Error to(uint64_t& out) const;
  Error to(float& out) const;
  Error to(double& out) const;
  Error to(etl::string_view& out) const;
  Error to(Characters& out) const;
  Error to(Bytes& out) const;

private:
  Kind  kind_{Kind::Characters};
  Bytes data_{};
};

/**
 * @brief Bounded argument list of one command call.
 *
 * Holds at most `MAX_ARGS` values; the parser reports
 * `UnexpectedNumberOfParameters` when a call carries more.
 */
class Arguments {
public:
  static constexpr size_t MAX_ARGS = 10;  ///< max arguments per call

  size_t size() const { return values_.size(); }
  bool empty() const { return values_.empty(); }
  bool full() const { return values_.full(); }
  void clear() { values_.clear(); }

  bool push(const Value& value) {
    if (values_.full()) return false;
    values_.push_back(value);
    return true;
  }

  const Value& operator[](size_t index) const { return values_[index]; }
  const Value* begin() const { return values_.begin(); }
  const Value* end() const { return values_.end(); }

  /// Convert argument @p index into @p out; `MissingParameter` when absent.
  template <typename T>
  Error get(size_t index, T& out) const {
    if (index >= values_.size()) return Error::Code::MissingParameter;
    return values_[index].to(out);
  }

private:
  etl::vector<Value, MAX_ARGS> values_;
};

} // namespace scpicore

#endif // SCPICORE_VALUE_HPP
