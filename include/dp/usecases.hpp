#pragma once

#include <cstdint>
#include <functional>

#include "dp/aggregate.hpp"
#include "dp/concurrency.hpp"
#include "dp/model.hpp"
#include "dp/transport.hpp"

namespace dp
{
// Called once per resolved probe, in sequence order.
using ProbeCallback = std::function<void(const Probe &)>;

// Sequential probe scheduler. One probe is outstanding at a time; the next
// one starts after the previous resolved and the interval since its send
// has elapsed.
class ProbeLoop
{
public:
    ProbeLoop(Connection &conn, Target target, RunConfig cfg, uint16_t first_id = 0);

    // Runs until cfg.count probes resolved (forever when 0) or cancel is set,
    // then returns the finalized summary. Fatal errors (IOError, InvalidName)
    // throw ProbeError; probes resolved so far remain in stats().
    const StatisticsSummary &run(const ProbeCallback &on_probe,
                                 const Cancellation *cancel = nullptr);

    StatsAggregator &stats() { return stats_; }

private:
    // Sends one query and waits for its reply. Sets interrupted when the wait
    // was cut short by cancellation; the probe is then resolved as Timeout.
    Probe probe_once(uint64_t seq, const Cancellation *cancel, bool &interrupted);

    Connection &conn_;
    Target target_;
    RunConfig cfg_;
    uint16_t next_id_;
    StatsAggregator stats_;
};
} // namespace dp
