#pragma once
/**
 * @file adapter_base.hpp
 * @brief Minimal byte-stream boundary between the processing loop and a transport.
 *
 * Header-only. No STL, no allocation: usable from firmware and from Linux hosts.
 */

#include <cstddef>
#include <cstdint>

#include "scpicore/ascii.hpp"

namespace scpicore::adapter {

// Return codes kept small so firmware transports can use them directly.
enum class IoStatus : uint8_t { Ok = 0, WouldBlock = 1, Closed = 2, Error = 3 };

/**
 * @brief Transport contract used by Processor.
 *
 * Contract:
 *  - read(buf, cap, count) fills up to cap bytes; Ok with count > 0 on data,
 *    WouldBlock when nothing is ready, Closed at end of stream.
 *  - write(data) accepts all bytes or fails.
 *  - flush() pushes buffered output to the peer.
 *  - name() is a short identifier for logs.
 */
class Adapter {
public:
  virtual ~Adapter() = default;
  virtual IoStatus read(uint8_t* buf, std::size_t cap, std::size_t& count) = 0;
  virtual IoStatus write(Bytes data) = 0;
  virtual IoStatus flush() = 0;
  virtual const char* name() const = 0;
};

inline const char* to_string(IoStatus status) {
  switch (status) {
    case IoStatus::Ok:         return "ok";
    case IoStatus::WouldBlock: return "would_block";
    case IoStatus::Closed:     return "closed";
    case IoStatus::Error:      return "error";
  }
  return "unknown";
}

} // namespace scpicore::adapter
