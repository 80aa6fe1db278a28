#include "ads_transport.hpp"
#include "ads_log.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <sstream>

namespace ads {

namespace {

std::string errno_message(int code) {
    return std::string(std::strerror(code));
}

int poll_timeout_ms(std::chrono::milliseconds t) {
    return t.count() < 0 ? 0 : static_cast<int>(t.count());
}

bool set_nonblocking(int fd, bool enable) {
    int fl = ::fcntl(fd, F_GETFL, 0);
    if (fl < 0) return false;
    fl = enable ? (fl | O_NONBLOCK) : (fl & ~O_NONBLOCK);
    return ::fcntl(fd, F_SETFL, fl) == 0;
}

// Connect a non-blocking socket and wait for completion up to `timeout`.
// Returns 0 or an errno value.
int connect_with_timeout(int fd, const sockaddr* addr, socklen_t len,
                         std::chrono::milliseconds timeout) {
    if (!set_nonblocking(fd, true)) return errno;

    int rc = ::connect(fd, addr, len);
    if (rc != 0 && errno != EINPROGRESS) {
        return errno;
    }
    if (rc != 0) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        for (;;) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0) return ETIMEDOUT;

            pollfd pfd{fd, POLLOUT, 0};
            int n = ::poll(&pfd, 1, poll_timeout_ms(left));
            if (n < 0) {
                if (errno == EINTR) continue;
                return errno;
            }
            if (n == 0) return ETIMEDOUT;

            int so_error = 0;
            socklen_t so_len = sizeof(so_error);
            if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &so_len) != 0) {
                return errno;
            }
            if (so_error != 0) return so_error;
            break;
        }
    }

    if (!set_nonblocking(fd, false)) return errno;
    return 0;
}

} // namespace

TcpTransport::~TcpTransport() {
    close();
}

Status TcpTransport::open(const std::string& host, uint16_t port, const Timeouts& timeouts) {
    close();

    std::ostringstream peer;
    peer << host << ":" << port;
    peer_ = peer.str();

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    addrinfo* results = nullptr;
    const std::string port_str = std::to_string(port);
    const int gai_result = ::getaddrinfo(host.c_str(), port_str.c_str(), &hints, &results);
    if (gai_result != 0) {
        return make_error(ErrorKind::ConnectFailure,
                          "resolving " + peer_ + ": " + gai_strerror(gai_result));
    }

    int last_error = 0;
    int fd = -1;
    for (addrinfo* rp = results; rp != nullptr; rp = rp->ai_next) {
        fd = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (fd < 0) {
            last_error = errno;
            continue;
        }

        last_error = connect_with_timeout(fd, rp->ai_addr, rp->ai_addrlen,
                                          timeouts.connect_or_default());
        if (last_error == 0) {
            break;
        }

        ::close(fd);
        fd = -1;
    }

    ::freeaddrinfo(results);

    if (fd < 0) {
        return make_error(ErrorKind::ConnectFailure,
                          "connecting to " + peer_ + ": " + errno_message(last_error));
    }

    Status st = apply_socket_options(fd, timeouts);
    if (!st.ok()) {
        ::close(fd);
        return st;
    }

    fd_.store(fd);
    log::get_logger("ads_transport")->debug("connected to {}", peer_);
    return Status();
}

Status TcpTransport::apply_socket_options(int fd, const Timeouts& timeouts) {
    const int enable = 1;
    if (::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &enable, sizeof(enable)) != 0 ||
        ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &enable, sizeof(enable)) != 0) {
        return make_error(ErrorKind::ConnectFailure, "setsockopt: " + errno_message(errno));
    }

    const auto write_timeout = timeouts.write_or_default();
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(write_timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((write_timeout.count() % 1000) * 1000);
    if (::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0) {
        return make_error(ErrorKind::ConnectFailure, "SO_SNDTIMEO: " + errno_message(errno));
    }
    return Status();
}

void TcpTransport::close() {
    int fd = fd_.exchange(-1);
    if (fd >= 0) {
        ::shutdown(fd, SHUT_RDWR);
        ::close(fd);
    }
}

void TcpTransport::shutdown() {
    int fd = fd_.load();
    if (fd >= 0) {
        ::shutdown(fd, SHUT_RDWR);
    }
}

Status TcpTransport::send_all(const std::vector<uint8_t>& bytes) {
    const int fd = fd_.load();
    if (fd < 0) {
        return make_error(ErrorKind::ConnectionLost, "transport is not connected");
    }

    size_t total = 0;
    while (total < bytes.size()) {
        const ssize_t sent = ::send(fd, bytes.data() + total, bytes.size() - total, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return make_error(ErrorKind::Timeout, "write timeout after " +
                                  std::to_string(total) + " of " + std::to_string(bytes.size()) + " bytes");
            }
            return make_error(ErrorKind::ConnectionLost, "send: " + errno_message(errno));
        }
        if (sent == 0) {
            return make_error(ErrorKind::ConnectionLost, "socket closed while sending");
        }
        total += static_cast<size_t>(sent);
    }
    return Status();
}

Result<size_t> TcpTransport::receive_some(uint8_t* buffer, size_t capacity,
                                          std::chrono::milliseconds wait) {
    const int fd = fd_.load();
    if (fd < 0) {
        return make_error(ErrorKind::ConnectionLost, "transport is not connected");
    }
    if (capacity == 0) {
        return size_t{0};
    }

    pollfd pfd{fd, POLLIN, 0};
    int n = ::poll(&pfd, 1, poll_timeout_ms(wait));
    if (n < 0) {
        if (errno == EINTR) {
            return size_t{0};
        }
        return make_error(ErrorKind::ConnectionLost, "poll: " + errno_message(errno));
    }
    if (n == 0) {
        return size_t{0};
    }

    for (;;) {
        const ssize_t received = ::recv(fd, buffer, capacity, 0);
        if (received > 0) {
            return static_cast<size_t>(received);
        }
        if (received == 0) {
            return make_error(ErrorKind::ConnectionLost, "remote host closed the connection");
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return size_t{0};
        }
        return make_error(ErrorKind::ConnectionLost, "recv: " + errno_message(errno));
    }
}

std::optional<std::array<uint8_t, 4>> TcpTransport::local_ipv4() const {
    const int fd = fd_.load();
    if (fd < 0) {
        return std::nullopt;
    }

    sockaddr_storage ss{};
    socklen_t len = sizeof(ss);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&ss), &len) != 0) {
        return std::nullopt;
    }

    const uint8_t* raw = nullptr;
    if (ss.ss_family == AF_INET) {
        const auto* in = reinterpret_cast<const sockaddr_in*>(&ss);
        raw = reinterpret_cast<const uint8_t*>(&in->sin_addr.s_addr);
    } else if (ss.ss_family == AF_INET6) {
        const auto* in6 = reinterpret_cast<const sockaddr_in6*>(&ss);
        if (!IN6_IS_ADDR_V4MAPPED(&in6->sin6_addr)) {
            return std::nullopt;
        }
        raw = in6->sin6_addr.s6_addr + 12;
    } else {
        return std::nullopt;
    }
    return std::array<uint8_t, 4>{{raw[0], raw[1], raw[2], raw[3]}};
}

} // namespace ads
