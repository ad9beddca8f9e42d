// -----------------------------------------------------------------------------
// response.cpp - IEEE 488.2 response encoders
//
// Numbers are formatted with std::to_chars into a stack buffer, then written
// to the sink in one call. Floats use the shortest round-trip form; when that
// form carries an exponent it is rewritten to NR3 (`1.5E-5`, `1E+20`).
//
// API & format table:
//   see include/scpicore/response.hpp
// -----------------------------------------------------------------------------
#include "scpicore/response.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>

namespace scpicore {

namespace {

constexpr size_t NUMBER_CAP = 32;               // fits any int64 or shortest double

template <typename T>
Error write_number(Write& out, T value) {
  char buf[NUMBER_CAP];
  auto res = std::to_chars(buf, buf + NUMBER_CAP, value);
  if (res.ec != std::errc()) return Error::Code::QueryError;
  return out.write_str(etl::string_view(buf, static_cast<size_t>(res.ptr - buf)));
}

// to_chars writes "1.5e-05"; NR3 wants an uppercase marker and no zero padding.
etl::string_view nr3_exponent(char* first, char* last) {
  char* marker = std::find(first, last, 'e');
  if (marker == last) return etl::string_view(first, static_cast<size_t>(last - first));
  *marker = 'E';
  char* digits = marker + 1;
  if (digits != last && (*digits == '+' || *digits == '-')) ++digits;
  char* lead = digits;
  while (lead + 1 < last && *lead == '0') ++lead;    // keep at least one digit
  last = std::copy(lead, last, digits);
  return etl::string_view(first, static_cast<size_t>(last - first));
}

template <typename T>
Error write_real(Write& out, T value) {
  if (std::isnan(value)) return out.write_str("9.91E+37");
  if (std::isinf(value)) return out.write_str(value > 0 ? "9.9E+37" : "-9.9E+37");
  char buf[NUMBER_CAP];
  auto res = std::to_chars(buf, buf + NUMBER_CAP, value);
  if (res.ec != std::errc()) return Error::Code::QueryError;
  return out.write_str(nr3_exponent(buf, res.ptr));
}

Error write_quoted(Write& out, etl::string_view text) {
  if (Error e = out.write_char('"')) return e;
  if (Error e = out.write_str(text)) return e;     // embedded quotes go out verbatim
  return out.write_char('"');
}

} // namespace

Error write_response(Write& out, bool value) { return out.write_char(value ? '1' : '0'); }

Error write_response(Write& out, int8_t value)   { return write_number(out, static_cast<int32_t>(value)); }
Error write_response(Write& out, uint8_t value)  { return write_number(out, static_cast<uint32_t>(value)); }
Error write_response(Write& out, int16_t value)  { return write_number(out, value); }
Error write_response(Write& out, uint16_t value) { return write_number(out, value); }
Error write_response(Write& out, int32_t value)  { return write_number(out, value); }
Error write_response(Write& out, uint32_t value) { return write_number(out, value); }
Error write_response(Write& out, int64_t value)  { return write_number(out, value); }
Error write_response(Write& out, uint64_t value) { return write_number(out, value); }

Error write_response(Write& out, float value)  { return write_real(out, value); }
Error write_response(Write& out, double value) { return write_real(out, value); }

Error write_response(Write& out, etl::string_view value) { return write_quoted(out, value); }

Error write_response(Write& out, const char* value) {
  return write_quoted(out, value ? etl::string_view(value) : etl::string_view());
}

Error write_response(Write& out, Characters value) { return out.write_str(value.text); }

// ---------------------------------------------------------------------------
// write_response(Bytes)
// Definite length arbitrary block: '#', digit count, length, payload.
// The digit count is a single digit, so lengths above 999999999 cannot be sent.
// ---------------------------------------------------------------------------
Error write_response(Write& out, Bytes value) {
  char len_buf[NUMBER_CAP];
  auto res = std::to_chars(len_buf, len_buf + NUMBER_CAP, value.size());
  if (res.ec != std::errc()) return Error::Code::TooMuchData;
  const size_t digits = static_cast<size_t>(res.ptr - len_buf);
  if (digits > 9) return Error::Code::TooMuchData;

  char header[2] = {'#', static_cast<char>('0' + digits)};
  if (Error e = out.write_str(etl::string_view(header, 2))) return e;
  if (Error e = out.write_str(etl::string_view(len_buf, digits))) return e;
  return out.write_bytes(value);
}

Error write_response(Write& out, const Error& value) {
  if (Error e = write_number(out, value.number())) return e;
  if (Error e = out.write_char(',')) return e;
  return write_quoted(out, value.message());
}

} // namespace scpicore
