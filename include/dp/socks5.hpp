#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "dp/errors.hpp"

namespace dp
{
enum class Socks5Method : uint8_t
{
    NoAuth = 0x00,
    UserPass = 0x02,
    NoAcceptable = 0xFF,
};

namespace socks5
{
struct Init {};
struct GreetingSent {};
struct AuthSent {};
struct ConnectSent {};
struct Connected {};
struct Failed
{
    ErrorKind kind{};
    Socks5Reply reply{Socks5Reply::Succeeded};
    std::string error;
};
} // namespace socks5

using Socks5State = std::variant<socks5::Init,
                                 socks5::GreetingSent,
                                 socks5::AuthSent,
                                 socks5::ConnectSent,
                                 socks5::Connected,
                                 socks5::Failed>;

struct Socks5Step
{
    enum class Action { Send, NeedMore, Done, Fail };

    Action action{Action::NeedMore};
    std::vector<uint8_t> out; // bytes for the proxy when action == Send
};

// Client side of RFC 1928 CONNECT with optional RFC 1929 username/password.
// Performs no I/O: feed() consumes bytes read from the proxy and returns
// what to write next.
class Socks5Handshake
{
public:
    Socks5Handshake(std::string dest_host,
                    uint16_t dest_port,
                    std::string username = {},
                    std::string password = {});

    // Init -> GreetingSent
    Socks5Step start();

    Socks5Step feed(const uint8_t *data, size_t len);
    Socks5Step feed(const std::vector<uint8_t> &data) { return feed(data.data(), data.size()); }

    const Socks5State &state() const { return state_; }
    bool connected() const { return std::holds_alternative<socks5::Connected>(state_); }
    bool failed() const { return std::holds_alternative<socks5::Failed>(state_); }
    const socks5::Failed *failure() const { return std::get_if<socks5::Failed>(&state_); }
    std::optional<Socks5Method> chosen_method() const { return method_; }

    // Bytes received after the CONNECT reply; they belong to the tunnel.
    std::vector<uint8_t> take_residual();

private:
    Socks5Step on_method_selection();
    Socks5Step on_auth_reply();
    Socks5Step on_connect_reply();
    Socks5Step fail(ErrorKind kind, std::string error, Socks5Reply reply = Socks5Reply::Succeeded);
    void consume(size_t n);

    std::vector<uint8_t> greeting() const;
    std::vector<uint8_t> auth_request() const;
    std::vector<uint8_t> connect_request() const;

    std::string dest_host_;
    uint16_t dest_port_;
    std::string username_;
    std::string password_;
    Socks5State state_{socks5::Init{}};
    std::optional<Socks5Method> method_;
    std::vector<uint8_t> inbox_;
};
} // namespace dp
