#include "Socket.h"
#include <system_error>
#include <cerrno>
#include <climits>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <arpa/inet.h>
#include <netinet/in.h>

namespace rack_scan {

Socket::Socket(int domain, int type, int protocol) {
    fd_ = ::socket(domain, type, protocol);
    if(fd_ < 0) {
        std::error_code ec(errno, std::system_category());
        throw std::system_error{ec, "socket() failed"};
    }
}

Socket& Socket::operator=(Socket&& other) noexcept {
    if(this != &other) {
        close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

void Socket::close() {
    if(fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

bool Socket::set_nonblock() {
    int flags = fcntl(fd_, F_GETFL, 0);
    if(flags < 0) return false;
    return fcntl(fd_, F_SETFL, flags | O_NONBLOCK) == 0;
}

int Socket::pending_error() const {
    int err = 0; socklen_t len = sizeof(err);
    if(getsockopt(fd_, SOL_SOCKET, SO_ERROR, &err, &len) < 0) return errno;
    return err;
}

bool make_sockaddr(const std::string& ip, int port, sockaddr_storage& addr, socklen_t& len) {
    std::memset(&addr, 0, sizeof(addr));
    auto* v4 = reinterpret_cast<sockaddr_in*>(&addr);
    if(inet_pton(AF_INET, ip.c_str(), &v4->sin_addr) == 1) {
        v4->sin_family = AF_INET;
        v4->sin_port = htons(static_cast<uint16_t>(port));
        len = sizeof(sockaddr_in);
        return true;
    }
    auto* v6 = reinterpret_cast<sockaddr_in6*>(&addr);
    if(inet_pton(AF_INET6, ip.c_str(), &v6->sin6_addr) == 1) {
        v6->sin6_family = AF_INET6;
        v6->sin6_port = htons(static_cast<uint16_t>(port));
        len = sizeof(sockaddr_in6);
        return true;
    }
    return false;
}

std::optional<Socket> start_connect(const std::string& ip, int port) {
    sockaddr_storage addr{}; socklen_t len = 0;
    if(!make_sockaddr(ip, port, addr, len)) return std::nullopt;
    Socket sock(addr.ss_family, SOCK_STREAM, IPPROTO_TCP);
    if(!sock.set_nonblock()) return std::nullopt;
    int rc = ::connect(sock.handle(), reinterpret_cast<sockaddr*>(&addr), len);
    if(rc == 0 || errno == EINPROGRESS) return std::optional<Socket>(std::move(sock));
    return std::nullopt;
}

std::optional<Socket> connect_with_timeout(const std::string& ip, int port, std::chrono::milliseconds timeout) {
    auto sock = start_connect(ip, port);
    if(!sock) return std::nullopt;
    pollfd pfd{sock->handle(), POLLOUT, 0};
    int rc;
    do { rc = ::poll(&pfd, 1, poll_timeout_ms(timeout)); } while(rc < 0 && errno == EINTR);
    if(rc <= 0) return std::nullopt; // timeout or poll error
    if(sock->pending_error() != 0) return std::nullopt;
    return sock;
}

std::optional<std::string> read_line(Socket& sock, std::chrono::milliseconds timeout, size_t max_len) {
    using SteadyClock = std::chrono::steady_clock;
    auto deadline = SteadyClock::now() + timeout;
    std::string buf;
    char chunk[256];
    while(buf.size() < max_len) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - SteadyClock::now());
        if(left.count() <= 0) return std::nullopt;
        pollfd pfd{sock.handle(), POLLIN, 0};
        int rc = ::poll(&pfd, 1, poll_timeout_ms(left));
        if(rc < 0 && errno == EINTR) continue;
        if(rc <= 0) return std::nullopt;
        ssize_t n = ::recv(sock.handle(), chunk, sizeof(chunk), 0);
        if(n < 0) {
            if(errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            return std::nullopt;
        }
        if(n == 0) { // peer closed
            if(buf.empty()) return std::nullopt;
            return buf;
        }
        buf.append(chunk, static_cast<size_t>(n));
        auto nl = buf.find('\n');
        if(nl != std::string::npos) return buf.substr(0, nl);
    }
    return buf.substr(0, max_len);
}

bool send_all(Socket& sock, const std::string& data) {
    size_t off = 0;
    while(off < data.size()) {
        ssize_t n = ::send(sock.handle(), data.data() + off, data.size() - off, MSG_NOSIGNAL);
        if(n < 0) {
            if(errno == EINTR) continue;
            if(errno == EAGAIN || errno == EWOULDBLOCK) {
                pollfd pfd{sock.handle(), POLLOUT, 0};
                if(::poll(&pfd, 1, 1000) <= 0) return false;
                continue;
            }
            return false;
        }
        off += static_cast<size_t>(n);
    }
    return true;
}

int poll_timeout_ms(std::chrono::milliseconds left) {
    if(left.count() <= 0) return 0;
    if(left.count() > INT_MAX) return INT_MAX;
    return static_cast<int>(left.count());
}

}
