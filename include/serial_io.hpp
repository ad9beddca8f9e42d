/**
 * @file serial_io.hpp
 * @brief Host-side helpers that give the simulator a TTY file descriptor.
 *
 * @details
 * PURPOSE
 * -------
 * `scpicore-sim` can serve SCPI over a serial line (a USB CDC gadget, a
 * null-modem cable, or one end of a `socat` pseudo-TTY pair). This header
 * declares the small POSIX surface needed for that: open the device in raw
 * mode, then hand the descriptor to `scpicore::adapter::FdAdapter`.
 *
 * DESIGN
 * ------
 * - Free functions, no class hierarchy, no threads.
 * - Raw 8N1, no echo, no flow control. SCPI line framing ('\n') is handled by
 *   the interpreter, the TTY layer must not translate it.
 * - The returned descriptor is blocking with VMIN=1, so reads wait for at
 *   least one byte and the processing loop stays simple.
 *
 * EXAMPLE
 * -------
 * @code
 *   int fd = scpicore::open_serial("/dev/ttyGS0", 115200);
 *   if (fd < 0) { // report and exit }
 *   scpicore::adapter::FdAdapter io(fd, fd, "serial");
 *   ...
 *   scpicore::close_serial(fd);
 * @endcode
 *
 * LIMITATIONS
 * -----------
 * - Baud table covers 9600..230400; other values fall back to 115200.
 * - Linux/POSIX only.
 */
#pragma once
#include <string>

namespace scpicore {

/**
 * @brief Open @p dev, switch it to raw blocking mode at @p baud.
 * @return file descriptor, or -1 on failure (errno is preserved).
 */
int open_serial(const std::string& dev, int baud = 115200);

/// Close a descriptor returned by open_serial(); negative values are ignored.
void close_serial(int fd);

} // namespace scpicore
