#include "dp/model.hpp"

#include <iterator>

namespace dp
{
const char *outcome_str(ProbeOutcome outcome)
{
    switch (outcome)
    {
        case ProbeOutcome::Success: return "success";
        case ProbeOutcome::Timeout: return "timeout";
        case ProbeOutcome::MalformedReply: return "malformed";
    }
    return "unknown";
}

const char *qtype_str(QueryType qtype)
{
    switch (qtype)
    {
        case QueryType::A: return "A";
        case QueryType::AAAA: return "AAAA";
    }
    return "A";
}

std::string rcode_str(int rcode)
{
    static const char *const kNames[] = {
        "NOERROR", "FORMERR", "SERVFAIL", "NXDOMAIN", "NOTIMP", "REFUSED",
        "YXDOMAIN", "YXRRSET", "NXRRSET", "NOTAUTH", "NOTZONE",
    };
    if (rcode >= 0 && rcode < static_cast<int>(std::size(kNames))) return kNames[rcode];
    return "RCODE" + std::to_string(rcode);
}
} // namespace dp
