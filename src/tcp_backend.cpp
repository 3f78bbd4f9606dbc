#include "tcp_backend.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include "hostlink_log.hpp"

namespace hostlink {

TcpBackend::TcpBackend(std::string host, int port, int connect_timeout_ms)
    : host_(std::move(host)), port_(port), connect_timeout_ms_(connect_timeout_ms) {}

TcpBackend::~TcpBackend() {
    shutdown();
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

Status TcpBackend::open() {
    std::string where = host_ + ":" + std::to_string(port_);

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons((uint16_t)port_);
    if (inet_pton(AF_INET, host_.c_str(), &addr.sin_addr) != 1) {
        return Error(ErrorKind::HostUnreachable, "bad IPv4 address " + host_);
    }

    int sock = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (sock < 0) {
        HLOG_ERROR("tcp", "socket() failed: %s", strerror(errno));
        return Error(ErrorKind::HostUnreachable, "socket() failed");
    }

    // Non-blocking connect bounded by connect_timeout_ms_
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
    int rc = ::connect(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    if (rc != 0 && errno != EINPROGRESS) {
        int err = errno;
        ::close(sock);
        HLOG_INFO("tcp", "connect(%s) failed: %s", where.c_str(), strerror(err));
        return Error(ErrorKind::HostUnreachable, where + ": " + strerror(err));
    }
    if (rc != 0) {
        pollfd pfd{sock, POLLOUT, 0};
        rc = ::poll(&pfd, 1, connect_timeout_ms_);
        if (rc <= 0) {
            ::close(sock);
            HLOG_INFO("tcp", "connect(%s) timed out after %d ms", where.c_str(), connect_timeout_ms_);
            return Error(ErrorKind::HostUnreachable, where + ": connect timed out");
        }
        int so_error = 0;
        socklen_t so_len = sizeof(so_error);
        getsockopt(sock, SOL_SOCKET, SO_ERROR, &so_error, &so_len);
        if (so_error != 0) {
            ::close(sock);
            HLOG_INFO("tcp", "connect(%s) failed: %s", where.c_str(), strerror(so_error));
            return Error(ErrorKind::HostUnreachable, where + ": " + strerror(so_error));
        }
    }
    fcntl(sock, F_SETFL, flags);

    int one = 1;
    setsockopt(sock, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

    fd_ = sock;
    HLOG_INFO("tcp", "Connected to %s", where.c_str());
    return Ok();
}

Result<size_t> TcpBackend::read(uint8_t* buf, size_t len) {
    if (fd_ < 0 || shut_.load()) return Err<size_t>(ErrorKind::LinkLost, "socket shut down");
    for (;;) {
        ssize_t n = ::recv(fd_, buf, len, 0);
        if (n >= 0) return Ok((size_t)n);
        if (errno == EINTR) continue;
        if (shut_.load()) return Err<size_t>(ErrorKind::LinkLost, "socket shut down");
        return Err<size_t>(ErrorKind::LinkLost, std::string("recv: ") + strerror(errno));
    }
}

Result<size_t> TcpBackend::write(const uint8_t* buf, size_t len) {
    if (fd_ < 0 || shut_.load()) return Err<size_t>(ErrorKind::LinkLost, "socket shut down");
    for (;;) {
        ssize_t n = ::send(fd_, buf, len, MSG_NOSIGNAL);
        if (n >= 0) return Ok((size_t)n);
        if (errno == EINTR) continue;
        return Err<size_t>(ErrorKind::LinkLost, std::string("send: ") + strerror(errno));
    }
}

void TcpBackend::shutdown() {
    if (shut_.exchange(true)) return;
    if (fd_ >= 0) ::shutdown(fd_, SHUT_RDWR);
}

} // namespace hostlink
