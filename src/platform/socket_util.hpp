#pragma once

// Thin POSIX socket helpers for the libssh2 transport.

#include <poll.h>

using socket_t = int;
#define SSHGATE_INVALID_SOCKET (-1)

namespace platform {

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Pending SO_ERROR on a socket (0 when none).
int socket_error(socket_t sock);

// Enable TCP keepalive with the given idle / interval / count settings.
void enable_tcp_keepalive(socket_t sock, int idle_secs, int interval_secs, int count);

// Close a socket.
void close_socket(socket_t sock);

} // namespace platform
