#include "dp/errors.hpp"

namespace dp
{
const char *error_kind_str(ErrorKind kind)
{
    switch (kind)
    {
        case ErrorKind::None: return "ok";
        case ErrorKind::InvalidName: return "invalid name";
        case ErrorKind::ConnectError: return "connect error";
        case ErrorKind::UnsupportedMethod: return "unsupported SOCKS5 method";
        case ErrorKind::AuthFailed: return "SOCKS5 authentication failed";
        case ErrorKind::ProxyRefused: return "proxy refused";
        case ErrorKind::ProtocolError: return "SOCKS5 protocol error";
        case ErrorKind::IOError: return "I/O error";
    }
    return "unknown";
}

const char *socks5_reply_str(Socks5Reply reply)
{
    switch (reply)
    {
        case Socks5Reply::Succeeded: return "succeeded";
        case Socks5Reply::GeneralFailure: return "general SOCKS server failure";
        case Socks5Reply::RuleDenied: return "connection not allowed by ruleset";
        case Socks5Reply::NetworkUnreachable: return "network unreachable";
        case Socks5Reply::HostUnreachable: return "host unreachable";
        case Socks5Reply::ConnectionRefused: return "connection refused";
        case Socks5Reply::TtlExpired: return "TTL expired";
        case Socks5Reply::CommandNotSupported: return "command not supported";
        case Socks5Reply::AddressTypeNotSupported: return "address type not supported";
        case Socks5Reply::Unassigned: return "unassigned";
    }
    return "unassigned";
}

Socks5Reply socks5_reply_from_code(uint8_t code)
{
    if (code <= 0x08) return static_cast<Socks5Reply>(code);
    return Socks5Reply::Unassigned;
}
} // namespace dp
