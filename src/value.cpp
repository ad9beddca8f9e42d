// -----------------------------------------------------------------------------
// value.cpp - lazy conversions from SCPI argument text to handler types
//
// The parser only records the lexical kind and the text of each argument.
// Conversion happens here, when a handler asks for a concrete type, so the
// same text "10" can be a bool, an int or a double depending on the command.
//
// All parsing goes through <charconv>: no locale, no allocation, no errno.
//
// API & conversion table:
//   see include/scpicore/value.hpp
// -----------------------------------------------------------------------------
#include "scpicore/value.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <limits>
#include <type_traits>

namespace scpicore {

namespace {

// Radix of a numeric kind, 0 for non-numeric kinds.
int radix_of(Value::Kind kind) {
  switch (kind) {
    case Value::Kind::Decimal:     return 10;
    case Value::Kind::Hexadecimal: return 16;
    case Value::Kind::Octal:       return 8;
    case Value::Kind::Binary:      return 2;
    default:                       return 0;
  }
}

// from_chars rejects a leading '+', SCPI allows it.
const char* skip_plus(const char* first, const char* last) {
  return (first != last && *first == '+') ? first + 1 : first;
}

// ---------------------------------------------------------------------------
// parse_decimal_as_integer()
// Fallback for decimal text with a fraction or exponent ("1E3", "5.0").
// Accepted only when the value is integral and exactly representable.
// ---------------------------------------------------------------------------
template <typename T>
Error parse_decimal_as_integer(const char* first, const char* last, T& out) {
  double d = 0.0;
  auto res = std::from_chars(first, last, d);
  if (res.ec == std::errc::result_out_of_range) return Error::Code::DataOutOfRange;
  if (res.ec != std::errc() || res.ptr != last) return Error::Code::NumericDataError;
  if (std::trunc(d) != d) return Error::Code::NumericDataError;

  constexpr double EXACT = 9007199254740992.0;            // 2^53
  const double lo = std::max(static_cast<double>(std::numeric_limits<T>::lowest()), -EXACT);
  const double hi = std::min(static_cast<double>(std::numeric_limits<T>::max()), EXACT);
  if (d < lo || d > hi) return Error::Code::DataOutOfRange;

  out = static_cast<T>(d);
  return Error();
}

template <typename T>
Error parse_integer(const Value& value, T& out) {
  const int base = radix_of(value.kind());
  if (base == 0) return Error::Code::DataTypeError;

  const etl::string_view text = value.text();
  const char* last  = text.data() + text.size();
  const char* first = skip_plus(text.data(), last);
  if (first == last) return Error::Code::NumericDataError;

  if (std::is_unsigned<T>::value && *first == '-') return Error::Code::DataOutOfRange;

  T parsed{};
  auto res = std::from_chars(first, last, parsed, base);
  if (res.ec == std::errc::result_out_of_range) return Error::Code::DataOutOfRange;
  if (res.ec == std::errc() && res.ptr == last) {
    out = parsed;
    return Error();
  }
  if (base == 10) return parse_decimal_as_integer(first, last, out);
  return Error::Code::NumericDataError;
}

template <typename T>
Error parse_float(const Value& value, T& out) {
  const int base = radix_of(value.kind());
  if (base == 0) return Error::Code::DataTypeError;

  if (base != 10) {                                       // #H / #Q / #B
    uint64_t bits = 0;
    if (Error e = parse_integer(value, bits)) return e;
    out = static_cast<T>(bits);
    return Error();
  }

  const etl::string_view text = value.text();
  const char* last  = text.data() + text.size();
  const char* first = skip_plus(text.data(), last);

  T parsed{};
  auto res = std::from_chars(first, last, parsed);
  if (res.ec == std::errc::result_out_of_range) return Error::Code::DataOutOfRange;
  if (res.ec != std::errc() || res.ptr != last) return Error::Code::NumericDataError;
  out = parsed;
  return Error();
}

} // namespace

// ---------------------------------------------------------------------------
// to(bool&)
// ---------------------------------------------------------------------------
Error Value::to(bool& out) const {
  const etl::string_view t = text();
  switch (kind_) {
    case Kind::Characters:
      if (ascii::iequals(t, "ON") || ascii::iequals(t, "TRUE"))   { out = true;  return Error(); }
      if (ascii::iequals(t, "OFF") || ascii::iequals(t, "FALSE")) { out = false; return Error(); }
      return Error::Code::IllegalParameterValue;
    case Kind::Decimal:
      if (t == etl::string_view("1")) { out = true;  return Error(); }
      if (t == etl::string_view("0")) { out = false; return Error(); }
      return Error::Code::IllegalParameterValue;
    case Kind::Hexadecimal:
    case Kind::Binary:
    case Kind::Octal:
      return Error::Code::IllegalParameterValue;
    default:
      return Error::Code::DataTypeError;
  }
}

Error Value::to(int8_t& out) const   { return parse_integer(*this, out); }
Error Value::to(uint8_t& out) const  { return parse_integer(*this, out); }
Error Value::to(int16_t& out) const  { return parse_integer(*this, out); }
Error Value::to(uint16_t& out) const { return parse_integer(*this, out); }
Error Value::to(int32_t& out) const  { return parse_integer(*this, out); }
Error Value::to(uint32_t& out) const { return parse_integer(*this, out); }
Error Value::to(int64_t& out) const  { return parse_integer(*this, out); }
Error Value::to(uint64_t& out) const { return parse_integer(*this, out); }
Error Value::to(float& out) const    { return parse_float(*this, out); }
Error Value::to(double& out) const   { return parse_float(*this, out); }

Error Value::to(etl::string_view& out) const {
  if (kind_ != Kind::String) return Error::Code::DataTypeError;
  out = text();
  return Error();
}

Error Value::to(Characters& out) const {
  if (kind_ != Kind::Characters) return Error::Code::DataTypeError;
  out.text = text();
  return Error();
}

Error Value::to(Bytes& out) const {
  if (kind_ != Kind::Arbitrary && kind_ != Kind::String) return Error::Code::DataTypeError;
  out = data_;
  return Error();
}

} // namespace scpicore
