#include "dp/output.hpp"

#include <iomanip>
#include <sstream>

#include "dp/json.hpp"

namespace dp
{
std::string build_ndjson_probe(const Probe &probe, const std::string &peer)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(3);
    os << "{";
    os << "\"seq\":" << probe.seq << ",\"id\":" << probe.id;
    os << R"(,"server":")" << json_escape(peer) << R"(")";
    os << R"(,"outcome":")" << outcome_str(probe.outcome) << R"(")";
    if (probe.outcome == ProbeOutcome::Success)
    {
        os << ",\"rtt_ms\":" << probe.rtt_ms
           << ",\"bytes\":" << probe.reply_size
           << R"(,"rcode":")" << rcode_str(probe.rcode) << R"(")";
    }
    else if (probe.outcome == ProbeOutcome::MalformedReply)
    {
        os << ",\"bytes\":" << probe.reply_size;
    }
    os << "}";
    return os.str();
}

std::string build_ndjson_summary(const StatisticsSummary &s, const std::string &peer)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(3);
    os << "{";
    os << R"("summary":{"server":")" << json_escape(peer) << R"(")";
    os << ",\"sent\":" << s.sent
       << ",\"received\":" << s.received
       << ",\"timeouts\":" << s.timeouts
       << ",\"malformed\":" << s.malformed
       << ",\"loss_pct\":" << s.loss_pct
       << ",\"min_ms\":" << s.min_ms
       << ",\"avg_ms\":" << s.avg_ms
       << ",\"max_ms\":" << s.max_ms
       << ",\"stddev_ms\":" << s.stddev_ms;
    os << "}}";
    return os.str();
}

std::string build_ndjson_error(const std::string &kind, const std::string &message)
{
    std::ostringstream os;
    os << R"({"error":{"kind":")" << json_escape(kind)
       << R"(","message":")" << json_escape(message) << R"("}})";
    return os.str();
}
} // namespace dp
