#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "dp/model.hpp"

namespace dp
{
// Text formatting (complete lines with trailing newline)
std::string format_header_text(const Target &target,
                               const std::string &peer,
                               size_t query_bytes,
                               const std::optional<ProxyConfig> &proxy);

std::string format_probe_text(const Probe &probe, const std::string &peer);

std::string format_summary_text(const StatisticsSummary &summary, const std::string &peer);

std::string format_error_text(const std::string &kind, const std::string &message);

// NDJSON builders (single-line JSON strings without trailing newline)
std::string build_ndjson_probe(const Probe &probe, const std::string &peer);

std::string build_ndjson_summary(const StatisticsSummary &summary, const std::string &peer);

std::string build_ndjson_error(const std::string &kind, const std::string &message);
} // namespace dp
