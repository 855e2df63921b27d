#include "dp/transport.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

// POSIX networking
#include <netinet/in.h>
#include <sys/socket.h>

#include "dp/errors.hpp"

namespace dp
{
UdpConnection::UdpConnection(Socket sock, const Endpoint &server)
    : sock_(std::move(sock)),
      server_(server),
      peer_(endpoint_str(reinterpret_cast<const sockaddr *>(&server.addr), server.len))
{
}

SendResult UdpConnection::send(const std::vector<uint8_t> &msg)
{
    SendResult out{};
    ssize_t n = ::sendto(sock_.get(),
                         msg.data(),
                         msg.size(),
                         0,
                         reinterpret_cast<const sockaddr *>(&server_.addr),
                         server_.len);
    if (n < 0 || static_cast<size_t>(n) != msg.size())
    {
        out.rc = -1;
        out.error = std::string("sendto: ") + (n < 0 ? std::strerror(errno) : "short write");
    }
    return out;
}

RecvResult UdpConnection::recv(int timeout_ms)
{
    RecvResult out{};
    const auto deadline = deadline_after(timeout_ms);
    std::vector<uint8_t> buf(65535);

    while (true)
    {
        switch (wait_readable(sock_.get(), deadline))
        {
            case WaitStatus::Timeout:
                out.status = RecvStatus::Timeout;
                return out;
            case WaitStatus::Interrupted:
                out.status = RecvStatus::Interrupted;
                return out;
            case WaitStatus::Error:
                out.status = RecvStatus::Error;
                out.error = std::string("poll: ") + std::strerror(errno);
                return out;
            case WaitStatus::Ready:
                break;
        }

        sockaddr_storage from{};
        socklen_t flen = sizeof(from);
        ssize_t n = ::recvfrom(sock_.get(),
                               buf.data(),
                               buf.size(),
                               0,
                               reinterpret_cast<sockaddr *>(&from),
                               &flen);
        if (n < 0)
        {
            if (errno == EINTR)
            {
                out.status = RecvStatus::Interrupted;
                return out;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) continue;
            out.status = RecvStatus::Error;
            out.error = std::string("recvfrom: ") + std::strerror(errno);
            return out;
        }
        if (!same_endpoint(from, server_.addr)) continue;

        out.status = RecvStatus::Ok;
        out.data.assign(buf.begin(), buf.begin() + n);
        return out;
    }
}

std::unique_ptr<Connection> open_udp(const Target &target)
{
    // resolved once per run
    const auto endpoints = resolve_endpoints(target.server, target.port, SOCK_DGRAM);
    const Endpoint &server = endpoints.front();

    Socket sock(::socket(server.family, SOCK_DGRAM | SOCK_CLOEXEC, IPPROTO_UDP));
    if (!sock)
    {
        throw ProbeError(ErrorKind::ConnectError,
                         std::string("socket: ") + std::strerror(errno));
    }
    return std::make_unique<UdpConnection>(std::move(sock), server);
}

std::unique_ptr<Connection> open_connection(const Target &target,
                                            const std::optional<ProxyConfig> &proxy,
                                            int setup_timeout_ms)
{
    if (proxy) return open_socks5_tunnel(target, *proxy, setup_timeout_ms);
    return open_udp(target);
}
} // namespace dp
