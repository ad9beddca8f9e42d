/**
 * @file processor.hpp
 * @brief Buffered top-level loop: Adapter bytes in, interpreter, Adapter bytes out.
 *
 * @details
 * `Processor<InputCap, OutputCap>` owns two fixed buffers:
 * - the input buffer accumulates reads until at least one '\n' is present;
 * - the output buffer collects the responses of one line before they are
 *   written and flushed.
 *
 * Each complete line is handed to the interpreter. If the interpreter returns
 * a tail (an arbitrary block that contains '\n', for example) the tail stays
 * pending and is retried together with the next line. New bytes are read only
 * after every complete line in the buffer has been processed and flushed.
 *
 * @par Limits
 * - A full input buffer without a processable statement reports
 *   `InputBufferOverrun`, drops the buffer and skips to the next '\n'. The
 *   rest of the overflowed program message is never executed.
 * - Responses of one line larger than OutputCap fail with `TooMuchData`
 *   (reported through the interpreter's error handler).
 *
 * @code
 *   scpicore::adapter::FdAdapter io(STDIN_FILENO, STDOUT_FILENO, "stdio");
 *   scpicore::Processor<256, 256> loop(interpreter);
 *   loop.process(io);      // until end of stream
 * @endcode
 */
#ifndef SCPICORE_PROCESSOR_HPP
#define SCPICORE_PROCESSOR_HPP

#include <stddef.h>
#include <stdint.h>
#include "etl/vector.h"
#include "scpicore/adapter/adapter_base.hpp"
#include "scpicore/interpreter.hpp"
#include "scpicore/response.hpp"

namespace scpicore {

template <size_t InputCap, size_t OutputCap>
class Processor {
  static_assert(InputCap > 0 && OutputCap > 0, "processor buffers must not be empty");

public:
  using IoStatus = adapter::IoStatus;

  explicit Processor(Interpreter& interpreter) : interpreter_(interpreter) {}

  /// One read plus processing of every complete line.
  IoStatus poll(adapter::Adapter& io) {
    if (input_.full()) {
      interpreter_.report(Error::Code::InputBufferOverrun);
      interpreter_.discard_line();
      input_.clear();
      scan_from_ = 0;
    }

    const size_t used = input_.size();
    input_.resize(InputCap);
    size_t count = 0;
    const IoStatus status = io.read(input_.data() + used, InputCap - used, count);
    input_.resize(used + (status == IoStatus::Ok ? count : 0));
    if (status != IoStatus::Ok) return status;

    return drain(io);
  }

  /// Poll until the stream closes or fails.
  IoStatus process(adapter::Adapter& io) {
    for (;;) {
      const IoStatus status = poll(io);
      if (status == IoStatus::Closed || status == IoStatus::Error) return status;
    }
  }

  size_t pending() const { return input_.size(); }

  /// Drop pending input and reset the interpreter, e.g. between TCP clients.
  void reset() {
    input_.clear();
    scan_from_ = 0;
    interpreter_.reset();
  }

private:
  IoStatus drain(adapter::Adapter& io) {
    size_t start = 0;                                  // first byte not yet consumed
    size_t scan = scan_from_;                          // first byte not yet searched for '\n'

    for (;;) {
      size_t newline = scan;
      while (newline < input_.size() && input_[newline] != '\n') ++newline;
      if (newline == input_.size()) break;

      const size_t line_end = newline + 1;
      output_.clear();
      BufferWriter writer(output_);
      const Bytes rest = interpreter_.run(Bytes(input_.data() + start, line_end - start), writer);

      if (!output_.empty()) {
        IoStatus status = io.write(writer.data());
        if (status == IoStatus::Ok) status = io.flush();
        if (status != IoStatus::Ok) return status;
      }

      start = line_end - rest.size();
      scan = line_end;
    }

    input_.erase(input_.begin(), input_.begin() + start);
    scan_from_ = scan - start;
    return IoStatus::Ok;
  }

  Interpreter& interpreter_;
  etl::vector<uint8_t, InputCap>  input_;
  etl::vector<uint8_t, OutputCap> output_;
  size_t scan_from_{0};
};

} // namespace scpicore

#endif // SCPICORE_PROCESSOR_HPP
