#pragma once

#include <optional>
#include <vector>

#include "dp/model.hpp"

namespace dp {

// Collects resolved probes in sequence order and produces the run summary.
class StatsAggregator {
public:
    void add(const Probe& probe);

    const std::vector<Probe>& probes() const { return probes_; }

    // Computed on the first call; later calls return the same summary.
    const StatisticsSummary& finalize();

    bool finalized() const { return summary_.has_value(); }

private:
    std::vector<Probe> probes_;
    std::optional<StatisticsSummary> summary_;
};

// sent/received/loss and min/avg/max/population stddev over successful rtts
StatisticsSummary summarize(const std::vector<Probe>& probes);

} // namespace dp
