#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace dp
{
enum class ErrorKind
{
    None = 0,
    InvalidName,
    ConnectError,
    UnsupportedMethod,
    AuthFailed,
    ProxyRefused,
    ProtocolError, // proxy spoke something other than SOCKS5
    IOError,
};

// CONNECT reply codes (RFC 1928 section 6)
enum class Socks5Reply : uint8_t
{
    Succeeded = 0x00,
    GeneralFailure = 0x01,
    RuleDenied = 0x02,
    NetworkUnreachable = 0x03,
    HostUnreachable = 0x04,
    ConnectionRefused = 0x05,
    TtlExpired = 0x06,
    CommandNotSupported = 0x07,
    AddressTypeNotSupported = 0x08,
    Unassigned = 0xFF,
};

const char *error_kind_str(ErrorKind kind);

const char *socks5_reply_str(Socks5Reply reply);

Socks5Reply socks5_reply_from_code(uint8_t code);

// Fatal error of a run. Thrown by transport setup and by the probe loop;
// caught once at the top and mapped to an exit status.
class ProbeError : public std::runtime_error
{
public:
    ProbeError(ErrorKind kind, const std::string &what,
               Socks5Reply reply = Socks5Reply::Succeeded)
        : std::runtime_error(what), kind_(kind), reply_(reply)
    {
    }

    ErrorKind kind() const { return kind_; }
    Socks5Reply reply() const { return reply_; }

private:
    ErrorKind kind_;
    Socks5Reply reply_;
};
} // namespace dp
