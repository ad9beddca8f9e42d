#pragma once
/**
 * @file adapter_posix.hpp
 * @brief Adapter over POSIX file descriptors (stdin/stdout, TTYs, sockets).
 *
 * Depends on: unistd.h, errno. Blocking or non-blocking descriptors both work;
 * a non-blocking read with no data reports WouldBlock.
 */

#if !defined(__unix__) && !defined(__APPLE__)
#  error "adapter_posix.hpp needs a POSIX system."
#endif

#include "scpicore/adapter/adapter_base.hpp"
#include <unistd.h>
#include <cerrno>

namespace scpicore::adapter {

class FdAdapter : public Adapter {
public:
  /// @param read_fd and @p write_fd may be the same descriptor (TTY, socket).
  FdAdapter(int read_fd, int write_fd, const char* name = "fd")
  : read_fd_(read_fd), write_fd_(write_fd), name_(name) {}

  IoStatus read(uint8_t* buf, std::size_t cap, std::size_t& count) override {
    count = 0;
    if (read_fd_ < 0 || !buf || cap == 0) return IoStatus::Error;
    for (;;) {
      ssize_t r = ::read(read_fd_, buf, cap);
      if (r > 0) { count = static_cast<std::size_t>(r); return IoStatus::Ok; }
      if (r == 0) return IoStatus::Closed;
      if (errno == EINTR) continue;
      if (errno == EAGAIN || errno == EWOULDBLOCK) return IoStatus::WouldBlock;
      return IoStatus::Error;
    }
  }

  IoStatus write(Bytes data) override {
    if (write_fd_ < 0) return IoStatus::Error;
    std::size_t done = 0;
    while (done < data.size()) {                       // short writes on pipes and sockets
      ssize_t w = ::write(write_fd_, data.data() + done, data.size() - done);
      if (w > 0) { done += static_cast<std::size_t>(w); continue; }
      if (w < 0 && errno == EINTR) continue;
      if (w < 0 && errno == EPIPE) return IoStatus::Closed;
      return IoStatus::Error;
    }
    return IoStatus::Ok;
  }

  IoStatus flush() override { return IoStatus::Ok; }   // unbuffered descriptors

  const char* name() const override { return name_; }

private:
  int read_fd_{-1};
  int write_fd_{-1};
  const char* name_;
};

} // namespace scpicore::adapter
