#include "dp/concurrency.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <thread>

namespace dp {

namespace {
std::atomic<Cancellation*> g_interrupt_target{nullptr};

extern "C" void on_interrupt(int)
{
    if (Cancellation* c = g_interrupt_target.load(std::memory_order_relaxed)) c->cancel();
}
} // namespace

bool install_interrupt_handler(Cancellation* cancel)
{
    g_interrupt_target.store(cancel, std::memory_order_relaxed);

    struct sigaction sa{};
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sa.sa_handler = cancel ? on_interrupt : SIG_DFL;
    return sigaction(SIGINT, &sa, nullptr) == 0 && sigaction(SIGTERM, &sa, nullptr) == 0;
}

bool sleep_for_cancelable(int ms, const Cancellation* cancel)
{
    using namespace std::chrono;
    constexpr auto kSlice = milliseconds(20);
    const auto until = steady_clock::now() + milliseconds(std::max(ms, 0));

    while (true)
    {
        if (cancel && cancel->is_cancelled()) return false;
        const auto now = steady_clock::now();
        if (now >= until) return true;
        std::this_thread::sleep_for(std::min<steady_clock::duration>(until - now, kSlice));
    }
}

} // namespace dp
