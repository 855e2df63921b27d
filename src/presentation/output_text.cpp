#include "dp/output.hpp"

#include <iomanip>
#include <sstream>

namespace dp {

std::string format_header_text(const Target& target,
                               const std::string& peer,
                               size_t query_bytes,
                               const std::optional<ProxyConfig>& proxy)
{
    std::ostringstream os;
    os << "PING " << peer << " for " << target.host
       << " (" << qtype_str(target.qtype) << "): " << query_bytes << " bytes of data";
    if (proxy)
    {
        os << " via SOCKS5 " << proxy->address << ':' << proxy->port;
        if (proxy->has_credentials()) os << " as " << proxy->username;
    }
    os << ".\n";
    return os.str();
}

std::string format_probe_text(const Probe& probe, const std::string& peer)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(3);
    switch (probe.outcome)
    {
        case ProbeOutcome::Success:
            os << probe.reply_size << " bytes from " << peer
               << ": seq=" << probe.seq << " id=" << probe.id;
            if (probe.rcode != 0) os << " rcode=" << rcode_str(probe.rcode);
            os << " time=" << probe.rtt_ms << " ms\n";
            break;
        case ProbeOutcome::Timeout:
            os << "Request timeout for seq=" << probe.seq << " id=" << probe.id << '\n';
            break;
        case ProbeOutcome::MalformedReply:
            os << "Malformed reply from " << peer
               << ": seq=" << probe.seq << " id=" << probe.id << '\n';
            break;
    }
    return os.str();
}

std::string format_summary_text(const StatisticsSummary& s, const std::string& peer)
{
    std::ostringstream os;
    os << std::fixed;
    os << "--- " << peer << " dnsping statistics ---\n";
    os << s.sent << " queries transmitted, " << s.received << " received, "
       << std::setprecision(2) << s.loss_pct << "% packet loss";
    if (s.malformed) os << ", " << s.malformed << " malformed";
    os << '\n';
    if (s.received)
    {
        os << std::setprecision(3)
           << "rtt min/avg/max/mdev = " << s.min_ms << '/' << s.avg_ms << '/'
           << s.max_ms << '/' << s.stddev_ms << " ms\n";
    }
    return os.str();
}

std::string format_error_text(const std::string& kind, const std::string& message)
{
    return "dnsping: " + kind + ": " + message + '\n';
}

} // namespace dp
