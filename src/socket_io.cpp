// ============================================================================
// socket_io.cpp - implementation for socket_io.hpp
//
// IPv4 only. Callers get plain file descriptors and wrap them in an
// FdAdapter; nothing here knows about SCPI.
// ============================================================================

#include "socket_io.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>

namespace scpicore {

// ---------------------------------------------------------------------------
// listen_tcp()
// SO_REUSEADDR so a restarted simulator can rebind right away.
// ---------------------------------------------------------------------------
int listen_tcp(uint16_t port, int backlog) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return -1;                          // errno set by socket()

    int opt = 1;
    sockaddr_in addr{};
    addr.sin_family      = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port        = htons(port);

    if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0 ||
        ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 ||
        ::listen(fd, backlog) < 0) {
        const int saved = errno;                    // close() may clobber errno
        ::close(fd);
        errno = saved;
        return -1;
    }
    return fd;                                      // ready for accept_client()
}

// ---------------------------------------------------------------------------
// accept_client()
// Responses are short lines; disable Nagle so each one leaves immediately.
// ---------------------------------------------------------------------------
int accept_client(int server_fd) {
    for (;;) {
        int fd = ::accept(server_fd, nullptr, nullptr);
        if (fd >= 0) {
            int one = 1;
            if (::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)) < 0) {
                const int saved = errno;
                ::close(fd);
                errno = saved;
                return -1;
            }
            return fd;
        }
        if (errno != EINTR) return -1;              // retry only on signal interruption
    }
}

void close_socket(int fd) {
    if (fd >= 0) ::close(fd);
}

} // namespace scpicore
