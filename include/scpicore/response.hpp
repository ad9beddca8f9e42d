/**
 * @file response.hpp
 * @brief Response sink and the IEEE 488.2 encoders for handler results.
 *
 * @details
 * ## Sink
 * `Write` is the byte sink a handler writes its result into. The interpreter
 * passes one down to every handler and appends the `\n` terminator after a
 * successful query. `BufferWriter` is the bounded implementation used by the
 * processing loop; it reports `TooMuchData` instead of truncating.
 *
 * ## Encoding
 * One `write_response()` overload per result type:
 * | Type                         | Wire form                        |
 * |------------------------------|----------------------------------|
 * | bool                         | `1` / `0`                        |
 * | integers                     | decimal, e.g. `-42`              |
 * | float / double               | shortest form, `966`, `1.23`     |
 * | NaN / +Inf / -Inf            | `9.91E+37` / `9.9E+37` / `-9.9E+37` |
 * | etl::string_view, const char*| `"text"` (quotes not escaped)    |
 * | Characters                   | `text` (bare)                    |
 * | Bytes                        | `#<n><len><bytes>`, empty `#10`  |
 * | Error                        | `-113,"Undefined header"`        |
 *
 * `write_list()` joins several values with commas, `write_sequence()` does
 * the same for a span of one type.
 */
#ifndef SCPICORE_RESPONSE_HPP
#define SCPICORE_RESPONSE_HPP

#include <stddef.h>
#include <stdint.h>
#include "etl/span.h"
#include "etl/string_view.h"
#include "etl/vector.h"
#include "scpicore/ascii.hpp"
#include "scpicore/error.hpp"
#include "scpicore/value.hpp"

namespace scpicore {

class Write {
public:
  virtual ~Write() = default;

  virtual Error write_bytes(Bytes data) = 0;
  virtual Error flush() { return Error(); }

  Error write_char(char c) {
    const uint8_t b = static_cast<uint8_t>(c);
    return write_bytes(Bytes(&b, 1));
  }
  Error write_str(etl::string_view text) { return write_bytes(as_bytes(text)); }
};

/// Appends into a caller-owned fixed buffer; overflow is `TooMuchData`.
class BufferWriter : public Write {
public:
  explicit BufferWriter(etl::ivector<uint8_t>& buffer) : buffer_(buffer) {}

  Error write_bytes(Bytes data) override {
    if (data.size() > buffer_.available()) return Error::Code::TooMuchData;
    buffer_.insert(buffer_.end(), data.begin(), data.end());
    return Error();
  }

  Bytes data() const { return Bytes(buffer_.data(), buffer_.size()); }
  etl::string_view text() const { return as_text(data()); }
  void clear() { buffer_.clear(); }

private:
  etl::ivector<uint8_t>& buffer_;
};

Error write_response(Write& out, bool value);
Error write_response(Write& out, int8_t value);
Error write_response(Write& out, uint8_t value);
Error write_response(Write& out, int16_t value);
Error write_response(Write& out, uint16_t value);
Error write_response(Write& out, int32_t value);
Error write_response(Write& out, uint32_t value);
Error write_response(Write& out, int64_t value);
Error write_response(Write& out, uint64_t value);
Error write_response(Write& out, float value);
Error write_response(Write& out, double value);
Error write_response(Write& out, etl::string_view value);
Error write_response(Write& out, const char* value);
Error write_response(Write& out, Characters value);
Error write_response(Write& out, Bytes value);
Error write_response(Write& out, const Error& value);

/// Comma-joined list of a span of values.
template <typename T>
Error write_sequence(Write& out, etl::span<const T> values) {
  for (size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      if (Error e = out.write_char(',')) return e;
    }
    if (Error e = write_response(out, values[i])) return e;
  }
  return Error();
}

template <typename T>
Error write_list(Write& out, const T& value) {
  return write_response(out, value);
}

/// Comma-joined list of heterogeneous values, e.g. `write_list(out, code, msg)`.
template <typename T, typename... Rest>
Error write_list(Write& out, const T& value, const Rest&... rest) {
  if (Error e = write_response(out, value)) return e;
  if (Error e = out.write_char(',')) return e;
  return write_list(out, rest...);
}

} // namespace scpicore

#endif // SCPICORE_RESPONSE_HPP
