// dnsping: measure DNS server latency with DNS queries, directly over UDP or
// tunneled through a SOCKS5 proxy.

#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "dp/cli.hpp"
#include "dp/concurrency.hpp"
#include "dp/errors.hpp"
#include "dp/output.hpp"
#include "dp/query.hpp"
#include "dp/transport.hpp"
#include "dp/usecases.hpp"

#ifndef DNSPING_VERSION
#define DNSPING_VERSION "0.0.0"
#endif

using namespace dp;

namespace
{
constexpr int kExitOk = 0;
constexpr int kExitFatal = 1;
constexpr int kExitUsage = 2;

void report_error(const Options &opt, const char *kind, const std::string &message)
{
    if (opt.ndjson) std::cout << build_ndjson_error(kind, message) << std::endl;
    std::cerr << format_error_text(kind, message);
}

void report_summary(const Options &opt, const StatisticsSummary &s, const std::string &peer)
{
    if (opt.ndjson) std::cout << build_ndjson_summary(s, peer) << std::endl;
    else std::cout << format_summary_text(s, peer) << std::flush;
}
} // namespace

int main(int argc, char **argv)
{
    Options opt{};
    std::string err;
    switch (parse_args(argc, argv, opt, err))
    {
        case ParseStatus::Help:
            std::cout << usage_text(argv[0]);
            return kExitOk;
        case ParseStatus::Version:
            std::cout << "dnsping " << DNSPING_VERSION << '\n';
            return kExitOk;
        case ParseStatus::Error:
            std::cerr << "dnsping: " << err << "\n\n" << usage_text(argv[0]);
            return kExitUsage;
        case ParseStatus::Ok:
            break;
    }

    const Target target = make_target(opt);
    const std::optional<ProxyConfig> proxy = make_proxy(opt);
    const RunConfig cfg = make_run_config(opt);

    // Reject a bad name before touching the network.
    QueryBuildResult probe_query = build_query(0, target.host, cfg.iterative, target.qtype);
    if (probe_query.rc != 0)
    {
        report_error(opt, error_kind_str(probe_query.kind), probe_query.error);
        return kExitFatal;
    }

    Cancellation cancel;
    if (!install_interrupt_handler(&cancel))
    {
        report_error(opt, "setup", "cannot install interrupt handler");
        return kExitFatal;
    }

    std::unique_ptr<Connection> conn;
    try
    {
        conn = open_connection(target, proxy, cfg.timeout_ms);
    }
    catch (const ProbeError &e)
    {
        report_error(opt, error_kind_str(e.kind()), e.what());
        return kExitFatal;
    }

    const std::string peer = conn->peer();
    if (!opt.ndjson)
    {
        std::cout << format_header_text(target, peer, probe_query.wire.size(), proxy) << std::flush;
    }

    ProbeLoop loop(*conn, target, cfg);
    auto on_probe = [&](const Probe &p)
    {
        if (opt.ndjson) std::cout << build_ndjson_probe(p, peer) << std::endl;
        else std::cout << format_probe_text(p, peer) << std::flush;
    };

    try
    {
        const StatisticsSummary &summary = loop.run(on_probe, &cancel);
        report_summary(opt, summary, peer);
    }
    catch (const ProbeError &e)
    {
        // partial statistics, then the error
        report_summary(opt, loop.stats().finalize(), peer);
        report_error(opt, error_kind_str(e.kind()), e.what());
        return kExitFatal;
    }
    return kExitOk;
}
