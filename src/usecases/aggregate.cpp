#include "dp/aggregate.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace dp {

void StatsAggregator::add(const Probe& probe)
{
    if (summary_) throw std::logic_error("probe added after finalize");
    probes_.push_back(probe);
}

const StatisticsSummary& StatsAggregator::finalize()
{
    if (!summary_) summary_ = summarize(probes_);
    return *summary_;
}

StatisticsSummary summarize(const std::vector<Probe>& probes)
{
    StatisticsSummary s{};
    std::vector<double> rtts;
    rtts.reserve(probes.size());
    for (const auto& p : probes)
    {
        switch (p.outcome)
        {
            case ProbeOutcome::Success: rtts.push_back(p.rtt_ms); break;
            case ProbeOutcome::Timeout: ++s.timeouts; break;
            case ProbeOutcome::MalformedReply: ++s.malformed; break;
        }
    }

    s.sent = probes.size();
    s.received = rtts.size();
    s.loss_pct = s.sent == 0 ? 0.0
                             : static_cast<double>(s.sent - s.received) /
                                   static_cast<double>(s.sent) * 100.0;
    if (rtts.empty()) return s;

    auto [min_it, max_it] = std::minmax_element(rtts.begin(), rtts.end());
    s.min_ms = *min_it;
    s.max_ms = *max_it;
    s.avg_ms = std::accumulate(rtts.begin(), rtts.end(), 0.0) /
               static_cast<double>(rtts.size());

    double sq = 0.0;
    for (double r : rtts) sq += (r - s.avg_ms) * (r - s.avg_ms);
    s.stddev_ms = std::sqrt(sq / static_cast<double>(rtts.size()));
    return s;
}

} // namespace dp
