#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <sys/socket.h>
#include <unistd.h>

#include "dp/model.hpp"

namespace dp
{
// Owning file descriptor; closes on destruction.
class Socket
{
public:
    Socket() = default;
    explicit Socket(int fd) : fd_(fd) {}
    ~Socket() { reset(); }

    Socket(const Socket &) = delete;
    Socket &operator=(const Socket &) = delete;

    Socket(Socket &&o) noexcept : fd_(o.fd_) { o.fd_ = -1; }

    Socket &operator=(Socket &&o) noexcept
    {
        if (this != &o)
        {
            reset();
            fd_ = o.fd_;
            o.fd_ = -1;
        }
        return *this;
    }

    int get() const { return fd_; }

    void reset(int fd = -1)
    {
        if (fd_ >= 0) ::close(fd_);
        fd_ = fd;
    }

    explicit operator bool() const { return fd_ >= 0; }

private:
    int fd_ = -1;
};

struct Endpoint
{
    sockaddr_storage addr{};
    socklen_t len{};
    int family{};
    int socktype{};
    int protocol{};
};

// getaddrinfo wrapper; throws ProbeError(ConnectError) when nothing resolves.
std::vector<Endpoint> resolve_endpoints(const std::string &host, uint16_t port, int socktype);

// "1.2.3.4:53" or "[::1]:53"
std::string endpoint_str(const sockaddr *sa, socklen_t len);

bool same_endpoint(const sockaddr_storage &a, const sockaddr_storage &b);

enum class WaitStatus { Ready, Timeout, Interrupted, Error };

// poll() for readability until the deadline; no deadline waits forever.
WaitStatus wait_readable(int fd, const std::optional<Clock::time_point> &deadline);

std::optional<Clock::time_point> deadline_after(int timeout_ms);
} // namespace dp
