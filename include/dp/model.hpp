#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "dp/options.hpp"

namespace dp
{
using Clock = std::chrono::steady_clock;

struct Target
{
    std::string host;   // name placed in the question section
    std::string server; // DNS server, literal address or host name
    uint16_t port = 53;
    QueryType qtype = QueryType::A;
};

struct ProxyConfig
{
    std::string address;
    uint16_t port = 1080;
    std::string username;
    std::string password;

    bool has_credentials() const { return !username.empty(); }
};

struct RunConfig
{
    int count = 0;         // 0 = unlimited
    int interval_ms = 1000;
    int timeout_ms = 1000; // 0 = wait indefinitely
    bool iterative = false;
};

enum class ProbeOutcome { Success, Timeout, MalformedReply };

struct Probe
{
    uint64_t seq{};
    uint16_t id{};
    Clock::time_point sent_at{};
    std::optional<Clock::time_point> received_at;
    ProbeOutcome outcome{ProbeOutcome::Timeout};
    double rtt_ms{};      // valid when outcome == Success
    size_t reply_size{};  // bytes of the matching reply
    int rcode{};
};

struct StatisticsSummary
{
    size_t sent{};
    size_t received{};
    size_t timeouts{};
    size_t malformed{};
    double loss_pct{};
    double min_ms{};
    double avg_ms{};
    double max_ms{};
    double stddev_ms{};
};

const char *outcome_str(ProbeOutcome outcome);

const char *qtype_str(QueryType qtype);

// NOERROR, SERVFAIL, NXDOMAIN, ... or "RCODE<n>"
std::string rcode_str(int rcode);
} // namespace dp
