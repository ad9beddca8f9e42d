/**
 * @file error_queue.hpp
 * @brief Error sink interface and the bounded SCPI error queue.
 *
 * @details
 * The interpreter never reports errors on the wire by itself. Every parse or
 * execution error is passed to an `ErrorHandler`. The usual handler is an
 * `ErrorQueue`, read back by the client through `SYSTem:ERRor?`.
 *
 * @par Overflow policy
 * The queue holds at most N entries. Pushing into a full queue replaces the
 * most recently enqueued entry with `QueueOverflow`; the older entries keep
 * their FIFO order and the length stays N. This matches SCPI-99 section 21.8.
 *
 * @par Example
 * @code
 *   scpicore::StaticErrorQueue<10> errors;
 *   errors.push_error(scpicore::Error::Code::UndefinedHeader);
 *   while (auto e = errors.pop_error()) {
 *     printf("%d,\"%s\"\n", e->number(), e->message());
 *   }
 * @endcode
 */
#ifndef SCPICORE_ERROR_QUEUE_HPP
#define SCPICORE_ERROR_QUEUE_HPP

#include <stddef.h>
#include "etl/deque.h"
#include "etl/optional.h"
#include "scpicore/error.hpp"

namespace scpicore {

/// Receives every error the interpreter could not resolve locally.
class ErrorHandler {
public:
  virtual ~ErrorHandler() = default;
  virtual void handle_error(const Error& error) = 0;
};

/// FIFO error store behind SYSTem:ERRor?.
class ErrorQueue : public ErrorHandler {
public:
  virtual size_t error_count() const = 0;
  virtual void push_error(const Error& error) = 0;
  virtual etl::optional<Error> pop_error() = 0;
  virtual void clear() = 0;

  void handle_error(const Error& error) override { push_error(error); }
};

/**
 * @brief Fixed-capacity error queue backed by `etl::deque`.
 * @tparam N maximum number of stored errors (at least 1).
 */
template <size_t N>
class StaticErrorQueue : public ErrorQueue {
  static_assert(N > 0, "error queue needs room for at least one entry");

public:
  static constexpr size_t CAPACITY = N;

  size_t error_count() const override { return queue_.size(); }

  void push_error(const Error& error) override {
    if (queue_.full()) {
      queue_.back() = Error(Error::Code::QueueOverflow);
      return;
    }
    queue_.push_back(error);
  }

  etl::optional<Error> pop_error() override {
    if (queue_.empty()) return etl::nullopt;
    Error front = queue_.front();
    queue_.pop_front();
    return front;
  }

  void clear() override { queue_.clear(); }

private:
  etl::deque<Error, N> queue_;
};

} // namespace scpicore

#endif // SCPICORE_ERROR_QUEUE_HPP
