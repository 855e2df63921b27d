#include "dp/transport.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

// POSIX networking
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>

#include "dp/errors.hpp"
#include "dp/socks5.hpp"

namespace dp
{
static bool send_all(int fd, const uint8_t *data, size_t len, std::string &err)
{
    size_t off = 0;
    while (off < len)
    {
        ssize_t n = ::send(fd, data + off, len - off, MSG_NOSIGNAL);
        if (n < 0)
        {
            if (errno == EINTR) continue;
            err = std::string("send: ") + std::strerror(errno);
            return false;
        }
        off += static_cast<size_t>(n);
    }
    return true;
}

static Socket connect_with_deadline(const Endpoint &ep,
                                    const std::optional<Clock::time_point> &deadline,
                                    std::string &err)
{
    Socket sock(::socket(ep.family, SOCK_STREAM | SOCK_CLOEXEC, IPPROTO_TCP));
    if (!sock)
    {
        err = std::string("socket: ") + std::strerror(errno);
        return {};
    }

    const int flags = ::fcntl(sock.get(), F_GETFL, 0);
    if (flags < 0 || ::fcntl(sock.get(), F_SETFL, flags | O_NONBLOCK) < 0)
    {
        err = std::string("fcntl: ") + std::strerror(errno);
        return {};
    }

    if (::connect(sock.get(), reinterpret_cast<const sockaddr *>(&ep.addr), ep.len) < 0)
    {
        if (errno != EINPROGRESS)
        {
            err = std::string("connect: ") + std::strerror(errno);
            return {};
        }
        pollfd pfd{};
        pfd.fd = sock.get();
        pfd.events = POLLOUT;
        int wait_ms = -1;
        if (deadline)
        {
            auto remain = std::chrono::ceil<std::chrono::milliseconds>(*deadline - Clock::now());
            wait_ms = remain.count() > 0 ? static_cast<int>(remain.count()) : 0;
        }
        int n = ::poll(&pfd, 1, wait_ms);
        if (n == 0)
        {
            err = "connect: timed out";
            return {};
        }
        if (n < 0)
        {
            err = std::string("connect: ") + std::strerror(errno);
            return {};
        }
        int so_err = 0;
        socklen_t so_len = sizeof(so_err);
        if (::getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &so_err, &so_len) < 0 || so_err != 0)
        {
            err = std::string("connect: ") + std::strerror(so_err ? so_err : errno);
            return {};
        }
    }

    // back to blocking; reads are gated by poll()
    if (::fcntl(sock.get(), F_SETFL, flags) < 0)
    {
        err = std::string("fcntl: ") + std::strerror(errno);
        return {};
    }
    return sock;
}

static void run_handshake(int fd,
                          Socks5Handshake &hs,
                          const std::optional<Clock::time_point> &deadline)
{
    Socks5Step step = hs.start();
    uint8_t buf[512];
    while (true)
    {
        if (step.action == Socks5Step::Action::Fail)
        {
            const socks5::Failed *f = hs.failure();
            throw ProbeError(f->kind, f->error, f->reply);
        }
        if (step.action == Socks5Step::Action::Done) return;

        if (step.action == Socks5Step::Action::Send)
        {
            std::string err;
            if (!send_all(fd, step.out.data(), step.out.size(), err))
            {
                throw ProbeError(ErrorKind::ConnectError, "SOCKS5 handshake: " + err);
            }
        }

        switch (wait_readable(fd, deadline))
        {
            case WaitStatus::Ready:
                break;
            case WaitStatus::Timeout:
                throw ProbeError(ErrorKind::ConnectError, "SOCKS5 handshake timed out");
            case WaitStatus::Interrupted:
                throw ProbeError(ErrorKind::ConnectError, "SOCKS5 handshake interrupted");
            case WaitStatus::Error:
                throw ProbeError(ErrorKind::ConnectError,
                                 std::string("SOCKS5 handshake: poll: ") + std::strerror(errno));
        }

        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n < 0)
        {
            if (errno == EINTR) continue;
            throw ProbeError(ErrorKind::ConnectError,
                             std::string("SOCKS5 handshake: recv: ") + std::strerror(errno));
        }
        if (n == 0)
        {
            throw ProbeError(ErrorKind::ConnectError, "proxy closed the connection during handshake");
        }
        step = hs.feed(buf, static_cast<size_t>(n));
    }
}

std::unique_ptr<Connection> open_socks5_tunnel(const Target &target,
                                               const ProxyConfig &proxy,
                                               int setup_timeout_ms)
{
    const auto deadline = deadline_after(setup_timeout_ms);
    const auto endpoints = resolve_endpoints(proxy.address, proxy.port, SOCK_STREAM);

    Socket sock;
    std::string err;
    for (const Endpoint &ep : endpoints)
    {
        sock = connect_with_deadline(ep, deadline, err);
        if (sock) break;
    }
    if (!sock)
    {
        throw ProbeError(ErrorKind::ConnectError,
                         "cannot reach proxy " + proxy.address + ":" +
                         std::to_string(proxy.port) + ": " + err);
    }

    Socks5Handshake hs(target.server, target.port, proxy.username, proxy.password);
    run_handshake(sock.get(), hs, deadline);

    std::string peer = target.server.find(':') != std::string::npos
                           ? "[" + target.server + "]:" + std::to_string(target.port)
                           : target.server + ":" + std::to_string(target.port);
    return std::make_unique<TunnelConnection>(std::move(sock), std::move(peer), hs.take_residual());
}

TunnelConnection::TunnelConnection(Socket sock, std::string peer, std::vector<uint8_t> residual)
    : sock_(std::move(sock)), peer_(std::move(peer)), pending_(std::move(residual))
{
}

SendResult TunnelConnection::send(const std::vector<uint8_t> &msg)
{
    SendResult out{};
    if (msg.size() > 0xffff)
    {
        out.rc = -1;
        out.error = "message exceeds 65535 bytes";
        return out;
    }
    std::vector<uint8_t> framed;
    framed.reserve(msg.size() + 2);
    framed.push_back(static_cast<uint8_t>(msg.size() >> 8));
    framed.push_back(static_cast<uint8_t>(msg.size() & 0xff));
    framed.insert(framed.end(), msg.begin(), msg.end());

    if (!send_all(sock_.get(), framed.data(), framed.size(), out.error)) out.rc = -1;
    return out;
}

std::optional<std::vector<uint8_t>> TunnelConnection::take_frame()
{
    if (pending_.size() < 2) return std::nullopt;
    const size_t len = (static_cast<size_t>(pending_[0]) << 8) | pending_[1];
    if (pending_.size() < 2 + len) return std::nullopt;

    std::vector<uint8_t> frame(pending_.begin() + 2,
                               pending_.begin() + 2 + static_cast<std::ptrdiff_t>(len));
    pending_.erase(pending_.begin(), pending_.begin() + 2 + static_cast<std::ptrdiff_t>(len));
    return frame;
}

RecvResult TunnelConnection::recv(int timeout_ms)
{
    RecvResult out{};
    // one deadline for the length prefix and the payload together
    const auto deadline = deadline_after(timeout_ms);
    uint8_t buf[4096];

    while (true)
    {
        if (auto frame = take_frame())
        {
            out.status = RecvStatus::Ok;
            out.data = std::move(*frame);
            return out;
        }

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

        ssize_t n = ::recv(sock_.get(), buf, sizeof(buf), 0);
        if (n < 0)
        {
            if (errno == EINTR)
            {
                out.status = RecvStatus::Interrupted;
                return out;
            }
            out.status = RecvStatus::Error;
            out.error = std::string("recv: ") + std::strerror(errno);
            return out;
        }
        if (n == 0)
        {
            out.status = RecvStatus::Error;
            out.error = "tunnel closed by proxy";
            return out;
        }
        pending_.insert(pending_.end(), buf, buf + n);
    }
}
} // namespace dp
