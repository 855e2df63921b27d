#include "dp/usecases.hpp"

#include <chrono>
#include <utility>

#include "dp/errors.hpp"
#include "dp/query.hpp"

namespace dp
{
ProbeLoop::ProbeLoop(Connection &conn, Target target, RunConfig cfg, uint16_t first_id)
    : conn_(conn), target_(std::move(target)), cfg_(cfg), next_id_(first_id)
{
}

const StatisticsSummary &ProbeLoop::run(const ProbeCallback &on_probe,
                                        const Cancellation *cancel)
{
    auto cancelled = [&] { return cancel && cancel->is_cancelled(); };
    const uint64_t count = cfg_.count > 0 ? static_cast<uint64_t>(cfg_.count) : 0;

    for (uint64_t seq = 0; count == 0 || seq < count; ++seq)
    {
        if (cancelled()) break;

        bool interrupted = false;
        Probe probe = probe_once(seq, cancel, interrupted);
        stats_.add(probe);
        if (on_probe) on_probe(probe);

        if (interrupted || cancelled()) break;
        if (count != 0 && seq + 1 == count) break;

        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            Clock::now() - probe.sent_at);
        const int remain = cfg_.interval_ms - static_cast<int>(elapsed.count());
        if (remain > 0 && !sleep_for_cancelable(remain, cancel)) break;
    }
    return stats_.finalize();
}

Probe ProbeLoop::probe_once(uint64_t seq, const Cancellation *cancel, bool &interrupted)
{
    Probe probe{};
    probe.seq = seq;
    probe.id = next_id_++; // wraps at 65536

    QueryBuildResult query = build_query(probe.id, target_.host, cfg_.iterative, target_.qtype);
    if (query.rc != 0) throw ProbeError(query.kind, query.error);

    probe.sent_at = Clock::now();
    SendResult sent = conn_.send(query.wire);
    if (sent.rc != 0) throw ProbeError(ErrorKind::IOError, sent.error);

    const auto deadline = deadline_after(cfg_.timeout_ms);
    while (true)
    {
        int wait_ms = 0; // conn_.recv treats <= 0 as no limit
        if (deadline)
        {
            auto remain = std::chrono::ceil<std::chrono::milliseconds>(*deadline - Clock::now());
            if (remain.count() <= 0)
            {
                probe.outcome = ProbeOutcome::Timeout;
                return probe;
            }
            wait_ms = static_cast<int>(remain.count());
        }

        RecvResult reply = conn_.recv(wait_ms);
        const auto now = Clock::now();
        switch (reply.status)
        {
            case RecvStatus::Timeout:
                probe.outcome = ProbeOutcome::Timeout;
                return probe;
            case RecvStatus::Interrupted:
                if (cancel && cancel->is_cancelled())
                {
                    interrupted = true;
                    probe.outcome = ProbeOutcome::Timeout;
                    return probe;
                }
                continue;
            case RecvStatus::Error:
                throw ProbeError(ErrorKind::IOError, reply.error);
            case RecvStatus::Ok:
                break;
        }

        ReplyInfo info = inspect_reply(reply.data);
        // stale or foreign reply: keep waiting on the same budget
        if (!info.has_id || info.id != probe.id) continue;

        probe.received_at = now;
        probe.reply_size = reply.data.size();
        if (!info.valid)
        {
            probe.outcome = ProbeOutcome::MalformedReply;
            return probe;
        }
        probe.outcome = ProbeOutcome::Success;
        probe.rcode = info.rcode;
        probe.rtt_ms = std::chrono::duration<double, std::milli>(now - probe.sent_at).count();
        return probe;
    }
}
} // namespace dp
