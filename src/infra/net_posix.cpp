#include "dp/net.hpp"

#include <cerrno>
#include <cstring>

// POSIX networking
#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>

#include "dp/errors.hpp"

namespace dp
{
std::vector<Endpoint> resolve_endpoints(const std::string &host, uint16_t port, int socktype)
{
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = socktype;
    hints.ai_flags = AI_NUMERICSERV;

    const std::string service = std::to_string(port);
    addrinfo *res = nullptr;
    int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (rc != 0 || !res)
    {
        if (res) freeaddrinfo(res);
        throw ProbeError(ErrorKind::ConnectError,
                         "cannot resolve " + host + ": " + gai_strerror(rc));
    }

    std::vector<Endpoint> out;
    for (const addrinfo *ai = res; ai != nullptr; ai = ai->ai_next)
    {
        if (ai->ai_family != AF_INET && ai->ai_family != AF_INET6) continue;
        Endpoint ep{};
        std::memcpy(&ep.addr, ai->ai_addr, ai->ai_addrlen);
        ep.len = static_cast<socklen_t>(ai->ai_addrlen);
        ep.family = ai->ai_family;
        ep.socktype = ai->ai_socktype;
        ep.protocol = ai->ai_protocol;
        out.push_back(ep);
    }
    freeaddrinfo(res);

    if (out.empty())
    {
        throw ProbeError(ErrorKind::ConnectError, "no usable address for " + host);
    }
    return out;
}

std::string endpoint_str(const sockaddr *sa, socklen_t /*len*/)
{
    char buf[INET6_ADDRSTRLEN]{};
    if (sa->sa_family == AF_INET)
    {
        const auto *sin = reinterpret_cast<const sockaddr_in *>(sa);
        if (!inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf))) return "?";
        return std::string(buf) + ":" + std::to_string(ntohs(sin->sin_port));
    }
    if (sa->sa_family == AF_INET6)
    {
        const auto *sin6 = reinterpret_cast<const sockaddr_in6 *>(sa);
        if (!inet_ntop(AF_INET6, &sin6->sin6_addr, buf, sizeof(buf))) return "?";
        return "[" + std::string(buf) + "]:" + std::to_string(ntohs(sin6->sin6_port));
    }
    return "?";
}

bool same_endpoint(const sockaddr_storage &a, const sockaddr_storage &b)
{
    if (a.ss_family != b.ss_family) return false;
    if (a.ss_family == AF_INET)
    {
        const auto &x = reinterpret_cast<const sockaddr_in &>(a);
        const auto &y = reinterpret_cast<const sockaddr_in &>(b);
        return x.sin_port == y.sin_port && x.sin_addr.s_addr == y.sin_addr.s_addr;
    }
    if (a.ss_family == AF_INET6)
    {
        const auto &x = reinterpret_cast<const sockaddr_in6 &>(a);
        const auto &y = reinterpret_cast<const sockaddr_in6 &>(b);
        return x.sin6_port == y.sin6_port &&
               std::memcmp(&x.sin6_addr, &y.sin6_addr, sizeof(in6_addr)) == 0;
    }
    return false;
}

std::optional<Clock::time_point> deadline_after(int timeout_ms)
{
    if (timeout_ms <= 0) return std::nullopt;
    return Clock::now() + std::chrono::milliseconds(timeout_ms);
}

WaitStatus wait_readable(int fd, const std::optional<Clock::time_point> &deadline)
{
    int wait_ms = -1;
    if (deadline)
    {
        auto remain = std::chrono::ceil<std::chrono::milliseconds>(*deadline - Clock::now());
        if (remain.count() <= 0) return WaitStatus::Timeout;
        wait_ms = static_cast<int>(remain.count());
    }

    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;
    int n = ::poll(&pfd, 1, wait_ms);
    if (n < 0) return errno == EINTR ? WaitStatus::Interrupted : WaitStatus::Error;
    if (n == 0) return WaitStatus::Timeout;
    // POLLHUP/POLLERR surface through the following read
    return WaitStatus::Ready;
}
} // namespace dp
