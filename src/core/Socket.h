#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <sys/socket.h>

namespace rack_scan {

// Owning wrapper for a socket descriptor; closed on destruction.
class Socket {
public:
    Socket() = default;
    // Throws std::system_error if socket(2) fails.
    Socket(int domain, int type, int protocol);
    explicit Socket(int fd) : fd_(fd) {}
    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;
    Socket(Socket&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    Socket& operator=(Socket&& other) noexcept;
    ~Socket() { close(); }

    void close();
    bool set_nonblock();
    // Pending SO_ERROR of a non-blocking connect; 0 means connected.
    int pending_error() const;
    int handle() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
private:
    int fd_ = -1;
};

// Fills addr from a numeric IPv4/IPv6 literal. Returns false if ip is not one.
bool make_sockaddr(const std::string& ip, int port, sockaddr_storage& addr, socklen_t& len);

// Starts a non-blocking TCP connect. Returns an empty optional if the attempt
// failed immediately (refused, unreachable, bad address).
std::optional<Socket> start_connect(const std::string& ip, int port);

// Blocking-style connect bounded by timeout; empty unless the connection completed.
std::optional<Socket> connect_with_timeout(const std::string& ip, int port, std::chrono::milliseconds timeout);

// Reads until '\n' or peer close within timeout. Returns the line (without the
// terminator) or empty optional if nothing complete arrived in time.
std::optional<std::string> read_line(Socket& sock, std::chrono::milliseconds timeout, size_t max_len = 1024);

bool send_all(Socket& sock, const std::string& data);

// Converts a remaining wait into a poll(2) argument, clamped to [0, INT_MAX].
int poll_timeout_ms(std::chrono::milliseconds left);

}
