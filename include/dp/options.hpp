#pragma once

#include <cstdint>
#include <string>

namespace dp
{
enum class QueryType { A, AAAA };

struct Options
{
    std::string server;                  // DNS server address (required)
    std::string host = "www.google.com"; // name to query
    uint16_t port = 53;
    bool iterate = false;                // clear the RD bit
    QueryType qtype = QueryType::A;
    // SOCKS5
    std::string proxy;                   // empty = direct UDP
    uint16_t proxy_port = 1080;
    std::string username;
    std::string password;
    // probe loop
    int count = 0;                       // 0 = unlimited
    int interval_ms = 1000;
    int timeout_ms = 1000;               // 0 = wait indefinitely
    bool ndjson = false;                 // NDJSON line per probe
};
} // namespace dp
