// ============================================================================
// serial_io.cpp - implementation for serial_io.hpp
// For API/overview see the matching .hpp.
// ============================================================================

#include "serial_io.hpp"

#include <fcntl.h>         // ::open flags, fcntl
#include <unistd.h>        // ::close
#include <termios.h>       // termios struct + raw mode helpers
#include <cerrno>

namespace scpicore {

// ---------------------------------------------------------------------------
// baud_to_speed()
// Map an integer baud rate to a termios constant (115200 fallback).
// ---------------------------------------------------------------------------
static speed_t baud_to_speed(int baud) {
    switch (baud) {
        case 9600:   return B9600;
        case 19200:  return B19200;
        case 38400:  return B38400;
        case 57600:  return B57600;
        case 115200: return B115200;
#ifdef B230400
        case 230400: return B230400;
#endif
        default:     return B115200;
    }
}

// ---------------------------------------------------------------------------
// set_raw()
// ----------
// Raw 8N1, no flow control, blocking reads of at least one byte.
// Returns: true on success, false if tcgetattr/tcsetattr fails.
// ---------------------------------------------------------------------------
static bool set_raw(int fd, speed_t speed) {
    termios tio{};
    if (tcgetattr(fd, &tio) != 0) return false;   // fetch current settings

    cfmakeraw(&tio);                              // wipe into raw 8N1 mode
    cfsetispeed(&tio, speed);
    cfsetospeed(&tio, speed);

    tio.c_cflag |= (CLOCAL | CREAD);              // ignore modem ctrl, enable read
    tio.c_cflag &= ~CRTSCTS;                      // no hardware flow control
    tio.c_cc[VMIN]  = 1;                          // block until one byte arrives
    tio.c_cc[VTIME] = 0;                          // no interbyte timer

    if (tcsetattr(fd, TCSANOW, &tio) != 0) return false;
    return tcflush(fd, TCIOFLUSH) == 0;           // drop stale bytes
}

// ---------------------------------------------------------------------------
// open_serial()
// -------------
// O_NONBLOCK only for the open itself (a missing carrier must not hang us),
// cleared once the port is configured.
// ---------------------------------------------------------------------------
int open_serial(const std::string& dev, int baud) {
    int fd = ::open(dev.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0) return -1;                        // open failed (perm, missing, etc.)

    if (!set_raw(fd, baud_to_speed(baud))) {
        const int saved = errno;
        ::close(fd);
        errno = saved;
        return -1;
    }

    const int flags = fcntl(fd, F_GETFL);
    if (flags < 0 || fcntl(fd, F_SETFL, flags & ~O_NONBLOCK) < 0) {
        const int saved = errno;
        ::close(fd);
        errno = saved;
        return -1;
    }
    return fd;
}

// ---------------------------------------------------------------------------
// close_serial()
// ---------------------------------------------------------------------------
void close_serial(int fd) {
    if (fd >= 0) ::close(fd);
}

} // namespace scpicore
