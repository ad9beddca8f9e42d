/**
 * @file socket_io.hpp
 * @brief TCP listener for serving SCPI over a raw socket (port 5025 by convention).
 *
 * The simulator accepts one client at a time. Each accepted descriptor is
 * wrapped in an `FdAdapter` and served until the peer closes.
 *
 * @code
 *   int srv = scpicore::listen_tcp(5025);
 *   for (;;) {
 *     int client = scpicore::accept_client(srv);
 *     if (client < 0) break;
 *     // serve ...
 *     scpicore::close_socket(client);
 *   }
 * @endcode
 */
#pragma once
#include <cstdint>

namespace scpicore {

/// Bind 0.0.0.0:@p port and listen. @return descriptor or -1 (errno set).
int listen_tcp(uint16_t port, int backlog = 1);

/// Block until a client connects. @return client descriptor or -1 (errno set).
int accept_client(int server_fd);

/// Close a socket descriptor; negative values are ignored.
void close_socket(int fd);

} // namespace scpicore
