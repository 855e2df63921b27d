#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <deque>
#include <functional>
#include <iostream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "dp/errors.hpp"
#include "dp/usecases.hpp"

using namespace dp;
using Bytes = std::vector<uint8_t>;

static void assert_true(bool cond, std::string_view msg)
{
    if (!cond)
    {
        std::cerr << "ASSERT FAILED: " << msg << std::endl;
        std::exit(1);
    }
}

static void assert_eq_int(long long a, long long b, const char *msg)
{
    if (a != b)
    {
        std::cerr << "ASSERT FAILED: " << msg << " | expected=" << b <<
                " actual=" << a << std::endl;
        std::exit(1);
    }
}

// Turns a query into a minimal response with the same id.
static Bytes answer_to(const Bytes &query)
{
    Bytes r = query;
    r[2] |= 0x80;
    r[3] = 0x80;
    return r;
}

static Bytes with_id(Bytes msg, uint16_t id)
{
    msg[0] = static_cast<uint8_t>(id >> 8);
    msg[1] = static_cast<uint8_t>(id & 0xff);
    return msg;
}

// Scripted transport. Each recv() pops the next step; when the script is
// empty the mock behaves like a silent server.
class MockConnection : public Connection
{
public:
    using Step = std::function<RecvResult(const Bytes &last_sent, int timeout_ms)>;

    SendResult send(const Bytes &msg) override
    {
        sent.push_back(msg);
        if (fail_send) return {-1, "mock send failure"};
        if (auto_answer) script.push_back(reply_step());
        return {};
    }

    RecvResult recv(int timeout_ms) override
    {
        recv_timeouts.push_back(timeout_ms);
        if (script.empty())
        {
            if (timeout_ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(timeout_ms));
            return {RecvStatus::Timeout, {}, {}};
        }
        Step step = script.front();
        script.pop_front();
        return step(sent.back(), timeout_ms);
    }

    std::string peer() const override { return "mock:53"; }

    static Step reply_step()
    {
        return [](const Bytes &q, int) { return RecvResult{RecvStatus::Ok, answer_to(q), {}}; };
    }

    std::deque<Step> script;
    std::vector<Bytes> sent;
    std::vector<int> recv_timeouts;
    bool auto_answer = false;
    bool fail_send = false;
};

static Target test_target()
{
    Target t{};
    t.host = "example.com";
    t.server = "192.0.2.1";
    t.port = 53;
    return t;
}

static RunConfig fast_cfg(int count)
{
    RunConfig cfg{};
    cfg.count = count;
    cfg.interval_ms = 0;
    cfg.timeout_ms = 200;
    return cfg;
}

static void test_count_five_terminates()
{
    MockConnection conn;
    conn.auto_answer = true;
    ProbeLoop loop(conn, test_target(), fast_cfg(5));
    std::vector<uint64_t> seqs;
    const StatisticsSummary &s = loop.run([&](const Probe &p) { seqs.push_back(p.seq); });

    assert_eq_int((long long) seqs.size(), 5, "5 probes emitted");
    assert_eq_int((long long) s.sent, 5, "5 sent");
    assert_eq_int((long long) s.received, 5, "5 received");
    for (size_t i = 0; i < seqs.size(); ++i) assert_eq_int((long long) seqs[i], (long long) i, "sequence order");

    const auto &probes = loop.stats().probes();
    for (size_t i = 0; i < probes.size(); ++i)
    {
        assert_eq_int(probes[i].id, (long long) i, "incrementing transaction id");
        assert_true(probes[i].outcome == ProbeOutcome::Success, "success");
        assert_true(probes[i].received_at.has_value(), "receive timestamp recorded");
        assert_true(probes[i].rtt_ms >= 0.0, "non-negative rtt");
    }
    assert_eq_int((long long) conn.sent.size(), 5, "one send per probe");
}

static void test_unlimited_with_cancellation()
{
    MockConnection conn;
    conn.auto_answer = true;
    ProbeLoop loop(conn, test_target(), fast_cfg(0));
    Cancellation cancel;
    const StatisticsSummary &s = loop.run(
        [&](const Probe &p)
        {
            if (p.seq + 1 == 3) cancel.cancel();
        },
        &cancel);
    assert_eq_int((long long) s.sent, 3, "exactly N probes recorded");
    assert_eq_int((long long) conn.sent.size(), 3, "no probe after cancellation");
}

static void test_timeout_against_silent_transport()
{
    MockConnection conn;
    RunConfig cfg = fast_cfg(1);
    cfg.timeout_ms = 200;
    ProbeLoop loop(conn, test_target(), cfg);

    const auto t0 = std::chrono::steady_clock::now();
    const StatisticsSummary &s = loop.run(nullptr);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t0).count();

    assert_true(loop.stats().probes().front().outcome == ProbeOutcome::Timeout, "resolved as Timeout");
    assert_true(ms >= 190 && ms < 1000, "resolved in about 200ms");
    assert_eq_int((long long) s.received, 0, "nothing received");
    assert_true(s.loss_pct == 100.0, "100% loss");
}

static void test_mismatched_id_is_discarded()
{
    MockConnection conn;
    conn.script.push_back([](const Bytes &q, int)
    {
        return RecvResult{RecvStatus::Ok, with_id(answer_to(q), 0xBEEF), {}};
    });
    conn.script.push_back(MockConnection::reply_step());
    ProbeLoop loop(conn, test_target(), fast_cfg(1));
    loop.run(nullptr);

    assert_true(loop.stats().probes().front().outcome == ProbeOutcome::Success,
                "matching reply after a stale one succeeds");
    assert_eq_int((long long) conn.recv_timeouts.size(), 2, "wait continued after mismatch");
    assert_true(conn.recv_timeouts[1] <= conn.recv_timeouts[0], "same budget, not restarted");
}

static void test_mismatched_then_timeout()
{
    MockConnection conn;
    conn.script.push_back([](const Bytes &q, int)
    {
        return RecvResult{RecvStatus::Ok, with_id(answer_to(q), 0x0101), {}};
    });
    ProbeLoop loop(conn, test_target(), fast_cfg(1));
    const StatisticsSummary &s = loop.run(nullptr);
    assert_true(loop.stats().probes().front().outcome == ProbeOutcome::Timeout,
                "only a foreign reply -> Timeout");
    assert_eq_int((long long) s.received, 0, "not counted as received");
}

static void test_malformed_reply_is_recorded_and_loop_continues()
{
    MockConnection conn;
    // QR clear: right id, not a response
    conn.script.push_back([](const Bytes &q, int) { return RecvResult{RecvStatus::Ok, q, {}}; });
    ProbeLoop loop(conn, test_target(), fast_cfg(2));
    conn.auto_answer = false;
    std::vector<ProbeOutcome> outcomes;
    loop.run([&](const Probe &p)
    {
        outcomes.push_back(p.outcome);
        conn.auto_answer = true; // second probe gets a proper answer
    });
    assert_eq_int((long long) outcomes.size(), 2, "two probes");
    assert_true(outcomes[0] == ProbeOutcome::MalformedReply, "first malformed");
    assert_true(outcomes[1] == ProbeOutcome::Success, "second succeeds");
    assert_eq_int((long long) loop.stats().finalize().malformed, 1, "malformed counted");
}

static void test_io_error_is_fatal()
{
    MockConnection conn;
    conn.auto_answer = true;
    ProbeLoop loop(conn, test_target(), fast_cfg(5));
    bool threw = false;
    try
    {
        loop.run([&](const Probe &p)
        {
            if (p.seq == 1)
            {
                conn.auto_answer = false;
                conn.script.push_back([](const Bytes &, int)
                {
                    return RecvResult{RecvStatus::Error, {}, "connection reset"};
                });
            }
        });
    }
    catch (const ProbeError &e)
    {
        threw = e.kind() == ErrorKind::IOError;
    }
    assert_true(threw, "IOError thrown");
    assert_eq_int((long long) loop.stats().probes().size(), 2, "earlier probes kept for partial stats");
    assert_eq_int((long long) loop.stats().finalize().received, 2, "partial summary");
}

static void test_send_error_is_fatal()
{
    MockConnection conn;
    conn.fail_send = true;
    ProbeLoop loop(conn, test_target(), fast_cfg(3));
    bool threw = false;
    try
    {
        loop.run(nullptr);
    }
    catch (const ProbeError &e)
    {
        threw = e.kind() == ErrorKind::IOError;
    }
    assert_true(threw, "send failure is IOError");
    assert_true(loop.stats().probes().empty(), "no probe recorded");
}

static void test_interrupt_during_wait()
{
    MockConnection conn;
    Cancellation cancel;
    conn.script.push_back([&](const Bytes &, int)
    {
        cancel.cancel();
        return RecvResult{RecvStatus::Interrupted, {}, {}};
    });
    ProbeLoop loop(conn, test_target(), fast_cfg(0));
    const StatisticsSummary &s = loop.run(nullptr, &cancel);
    assert_eq_int((long long) s.sent, 1, "outstanding probe resolved");
    assert_true(loop.stats().probes().front().outcome == ProbeOutcome::Timeout, "as Timeout");
    assert_eq_int((long long) conn.sent.size(), 1, "loop stopped");
}

static void test_spurious_interrupt_keeps_waiting()
{
    MockConnection conn;
    conn.script.push_back([](const Bytes &, int) { return RecvResult{RecvStatus::Interrupted, {}, {}}; });
    conn.script.push_back(MockConnection::reply_step());
    ProbeLoop loop(conn, test_target(), fast_cfg(1));
    loop.run(nullptr);
    assert_true(loop.stats().probes().front().outcome == ProbeOutcome::Success,
                "signal without cancellation does not resolve the probe");
}

static void test_interval_paces_sends()
{
    MockConnection conn;
    conn.auto_answer = true;
    RunConfig cfg = fast_cfg(3);
    cfg.interval_ms = 100;
    ProbeLoop loop(conn, test_target(), cfg);

    const auto t0 = std::chrono::steady_clock::now();
    loop.run(nullptr);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t0).count();
    assert_true(ms >= 190, "two intervals between three sends");
    assert_true(ms < 1000, "no sleep after the last probe");

    const auto &p = loop.stats().probes();
    const auto gap = std::chrono::duration_cast<std::chrono::milliseconds>(p[1].sent_at - p[0].sent_at);
    assert_true(gap.count() >= 95, "interval measured from previous send");
}

static void test_transaction_id_wraps()
{
    MockConnection conn;
    conn.auto_answer = true;
    ProbeLoop loop(conn, test_target(), fast_cfg(2), 0xFFFF);
    loop.run(nullptr);
    const auto &p = loop.stats().probes();
    assert_eq_int(p[0].id, 0xFFFF, "first id");
    assert_eq_int(p[1].id, 0, "wrapped id");
    assert_true(p[1].outcome == ProbeOutcome::Success, "wrapped id still matches");
}

static void test_iterative_clears_rd()
{
    MockConnection conn;
    conn.auto_answer = true;
    RunConfig cfg = fast_cfg(1);
    cfg.iterative = true;
    ProbeLoop loop(conn, test_target(), cfg);
    loop.run(nullptr);
    assert_true((conn.sent.front()[2] & 0x01) == 0, "RD clear on the wire");
}

static void test_invalid_name_is_fatal()
{
    MockConnection conn;
    Target t = test_target();
    t.host = std::string(70, 'x') + ".example";
    ProbeLoop loop(conn, t, fast_cfg(1));
    bool threw = false;
    try
    {
        loop.run(nullptr);
    }
    catch (const ProbeError &e)
    {
        threw = e.kind() == ErrorKind::InvalidName;
    }
    assert_true(threw, "InvalidName thrown");
    assert_true(conn.sent.empty(), "nothing sent");
}

int main()
{
    test_count_five_terminates();
    test_unlimited_with_cancellation();
    test_timeout_against_silent_transport();
    test_mismatched_id_is_discarded();
    test_mismatched_then_timeout();
    test_malformed_reply_is_recorded_and_loop_continues();
    test_io_error_is_fatal();
    test_send_error_is_fatal();
    test_interrupt_during_wait();
    test_spurious_interrupt_keeps_waiting();
    test_interval_paces_sends();
    test_transaction_id_wraps();
    test_iterative_clears_rd();
    test_invalid_name_is_fatal();
    std::cout << "probe loop tests: OK" << std::endl;
    return 0;
}
