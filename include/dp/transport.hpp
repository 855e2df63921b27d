#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "dp/model.hpp"
#include "dp/net.hpp"

namespace dp
{
enum class RecvStatus { Ok, Timeout, Interrupted, Error };

struct RecvResult
{
    RecvStatus status{RecvStatus::Timeout};
    std::vector<uint8_t> data; // one DNS message when status == Ok
    std::string error;         // when status == Error
};

struct SendResult
{
    int rc{};          // 0 on success, -1 on error
    std::string error;
};

// One DNS message in, one DNS message out. Exclusively owned by the probe
// loop for the lifetime of a run.
class Connection
{
public:
    virtual ~Connection() = default;

    virtual SendResult send(const std::vector<uint8_t> &msg) = 0;

    // Waits at most timeout_ms for one message; timeout_ms <= 0 waits forever.
    virtual RecvResult recv(int timeout_ms) = 0;

    // Address of the DNS server as shown to the user.
    virtual std::string peer() const = 0;
};

// Direct UDP to the server. Datagrams from any other source are ignored.
class UdpConnection : public Connection
{
public:
    UdpConnection(Socket sock, const Endpoint &server);

    SendResult send(const std::vector<uint8_t> &msg) override;
    RecvResult recv(int timeout_ms) override;
    std::string peer() const override { return peer_; }

private:
    Socket sock_;
    Endpoint server_;
    std::string peer_;
};

// TCP stream relayed by a SOCKS5 proxy; messages carry a 2-byte big-endian
// length prefix (RFC 1035 4.2.2).
class TunnelConnection : public Connection
{
public:
    TunnelConnection(Socket sock, std::string peer, std::vector<uint8_t> residual = {});

    SendResult send(const std::vector<uint8_t> &msg) override;
    RecvResult recv(int timeout_ms) override;
    std::string peer() const override { return peer_; }

private:
    // Pops one complete frame from pending_ if present.
    std::optional<std::vector<uint8_t>> take_frame();

    Socket sock_;
    std::string peer_;
    std::vector<uint8_t> pending_; // partial frame carried across recv calls
};

// Opens the transport for a run. With a proxy, connects to it and performs
// the SOCKS5 handshake within setup_timeout_ms (<= 0: no limit).
// Throws ProbeError with ConnectError or a SOCKS5 handshake kind.
std::unique_ptr<Connection> open_connection(const Target &target,
                                            const std::optional<ProxyConfig> &proxy,
                                            int setup_timeout_ms);

std::unique_ptr<Connection> open_udp(const Target &target);

std::unique_ptr<Connection> open_socks5_tunnel(const Target &target,
                                               const ProxyConfig &proxy,
                                               int setup_timeout_ms);
} // namespace dp
