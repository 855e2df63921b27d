#include "dp/socks5.hpp"

#include <cstddef>
#include <utility>

// POSIX networking
#include <arpa/inet.h>
#include <netinet/in.h>

namespace dp
{
static constexpr uint8_t kSocksVersion = 0x05;
static constexpr uint8_t kAuthVersion = 0x01;
static constexpr uint8_t kCmdConnect = 0x01;
static constexpr uint8_t kAtypIPv4 = 0x01;
static constexpr uint8_t kAtypDomain = 0x03;
static constexpr uint8_t kAtypIPv6 = 0x04;

Socks5Handshake::Socks5Handshake(std::string dest_host,
                                 uint16_t dest_port,
                                 std::string username,
                                 std::string password)
    : dest_host_(std::move(dest_host)),
      dest_port_(dest_port),
      username_(std::move(username)),
      password_(std::move(password))
{
}

Socks5Step Socks5Handshake::start()
{
    if (!std::holds_alternative<socks5::Init>(state_))
    {
        return fail(ErrorKind::ProtocolError, "handshake already started");
    }
    if (dest_host_.empty() || dest_host_.size() > 255)
    {
        return fail(ErrorKind::ConnectError, "destination must be 1..255 bytes");
    }
    if (username_.size() > 255 || password_.size() > 255)
    {
        return fail(ErrorKind::AuthFailed, "username and password are limited to 255 bytes");
    }
    state_ = socks5::GreetingSent{};
    return {Socks5Step::Action::Send, greeting()};
}

Socks5Step Socks5Handshake::feed(const uint8_t *data, size_t len)
{
    if (failed()) return {Socks5Step::Action::Fail, {}};
    if (connected())
    {
        inbox_.insert(inbox_.end(), data, data + len);
        return {Socks5Step::Action::Done, {}};
    }
    inbox_.insert(inbox_.end(), data, data + len);

    if (std::holds_alternative<socks5::GreetingSent>(state_)) return on_method_selection();
    if (std::holds_alternative<socks5::AuthSent>(state_)) return on_auth_reply();
    if (std::holds_alternative<socks5::ConnectSent>(state_)) return on_connect_reply();
    return fail(ErrorKind::ProtocolError, "data received before greeting");
}

std::vector<uint8_t> Socks5Handshake::take_residual()
{
    if (!connected()) return {};
    std::vector<uint8_t> out;
    out.swap(inbox_);
    return out;
}

Socks5Step Socks5Handshake::on_method_selection()
{
    if (inbox_.size() < 2) return {Socks5Step::Action::NeedMore, {}};
    const uint8_t ver = inbox_[0];
    const uint8_t method = inbox_[1];
    consume(2);

    if (ver != kSocksVersion)
    {
        return fail(ErrorKind::ProtocolError,
                    "proxy answered with version " + std::to_string(ver));
    }
    if (method == static_cast<uint8_t>(Socks5Method::NoAcceptable))
    {
        return fail(ErrorKind::UnsupportedMethod, "proxy accepted none of the offered methods");
    }
    if (method == static_cast<uint8_t>(Socks5Method::NoAuth))
    {
        method_ = Socks5Method::NoAuth;
        state_ = socks5::ConnectSent{};
        return {Socks5Step::Action::Send, connect_request()};
    }
    if (method == static_cast<uint8_t>(Socks5Method::UserPass) && !username_.empty())
    {
        method_ = Socks5Method::UserPass;
        state_ = socks5::AuthSent{};
        return {Socks5Step::Action::Send, auth_request()};
    }
    return fail(ErrorKind::UnsupportedMethod,
                "proxy selected method " + std::to_string(method) + " which was not offered");
}

Socks5Step Socks5Handshake::on_auth_reply()
{
    if (inbox_.size() < 2) return {Socks5Step::Action::NeedMore, {}};
    const uint8_t ver = inbox_[0];
    const uint8_t status = inbox_[1];
    consume(2);

    if (ver != kAuthVersion)
    {
        return fail(ErrorKind::ProtocolError,
                    "unexpected auth sub-negotiation version " + std::to_string(ver));
    }
    if (status != 0x00)
    {
        return fail(ErrorKind::AuthFailed,
                    "proxy rejected credentials (status " + std::to_string(status) + ")");
    }
    state_ = socks5::ConnectSent{};
    return {Socks5Step::Action::Send, connect_request()};
}

Socks5Step Socks5Handshake::on_connect_reply()
{
    // VER REP RSV ATYP BND.ADDR BND.PORT
    if (inbox_.size() < 2) return {Socks5Step::Action::NeedMore, {}};
    if (inbox_[0] != kSocksVersion)
    {
        return fail(ErrorKind::ProtocolError,
                    "proxy answered CONNECT with version " + std::to_string(inbox_[0]));
    }
    if (inbox_[1] != 0x00)
    {
        const Socks5Reply reply = socks5_reply_from_code(inbox_[1]);
        return fail(ErrorKind::ProxyRefused,
                    std::string("proxy refused CONNECT: ") + socks5_reply_str(reply),
                    reply);
    }
    if (inbox_.size() < 5) return {Socks5Step::Action::NeedMore, {}};

    size_t addr_len = 0;
    switch (inbox_[3])
    {
        case kAtypIPv4: addr_len = 4; break;
        case kAtypIPv6: addr_len = 16; break;
        case kAtypDomain: addr_len = 1 + static_cast<size_t>(inbox_[4]); break;
        default:
            return fail(ErrorKind::ProtocolError,
                        "unknown bound address type " + std::to_string(inbox_[3]));
    }
    const size_t total = 4 + addr_len + 2;
    if (inbox_.size() < total) return {Socks5Step::Action::NeedMore, {}};
    consume(total);

    state_ = socks5::Connected{};
    return {Socks5Step::Action::Done, {}};
}

Socks5Step Socks5Handshake::fail(ErrorKind kind, std::string error, Socks5Reply reply)
{
    state_ = socks5::Failed{kind, reply, std::move(error)};
    inbox_.clear();
    return {Socks5Step::Action::Fail, {}};
}

void Socks5Handshake::consume(size_t n)
{
    inbox_.erase(inbox_.begin(), inbox_.begin() + static_cast<std::ptrdiff_t>(n));
}

std::vector<uint8_t> Socks5Handshake::greeting() const
{
    if (username_.empty())
    {
        return {kSocksVersion, 1, static_cast<uint8_t>(Socks5Method::NoAuth)};
    }
    return {kSocksVersion,
            2,
            static_cast<uint8_t>(Socks5Method::NoAuth),
            static_cast<uint8_t>(Socks5Method::UserPass)};
}

std::vector<uint8_t> Socks5Handshake::auth_request() const
{
    std::vector<uint8_t> out;
    out.reserve(3 + username_.size() + password_.size());
    out.push_back(kAuthVersion);
    out.push_back(static_cast<uint8_t>(username_.size()));
    out.insert(out.end(), username_.begin(), username_.end());
    out.push_back(static_cast<uint8_t>(password_.size()));
    out.insert(out.end(), password_.begin(), password_.end());
    return out;
}

std::vector<uint8_t> Socks5Handshake::connect_request() const
{
    std::vector<uint8_t> out{kSocksVersion, kCmdConnect, 0x00};

    in_addr v4{};
    in6_addr v6{};
    if (inet_pton(AF_INET, dest_host_.c_str(), &v4) == 1)
    {
        const auto *b = reinterpret_cast<const uint8_t *>(&v4);
        out.push_back(kAtypIPv4);
        out.insert(out.end(), b, b + 4);
    }
    else if (inet_pton(AF_INET6, dest_host_.c_str(), &v6) == 1)
    {
        const auto *b = reinterpret_cast<const uint8_t *>(&v6);
        out.push_back(kAtypIPv6);
        out.insert(out.end(), b, b + 16);
    }
    else
    {
        out.push_back(kAtypDomain);
        out.push_back(static_cast<uint8_t>(dest_host_.size()));
        out.insert(out.end(), dest_host_.begin(), dest_host_.end());
    }
    out.push_back(static_cast<uint8_t>(dest_port_ >> 8));
    out.push_back(static_cast<uint8_t>(dest_port_ & 0xff));
    return out;
}
} // namespace dp
