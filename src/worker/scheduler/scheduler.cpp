// SPDX-License-Identifier: Apache-2.0
#include "worker/scheduler/scheduler.hpp"

#include "common/logger.hpp"

#include <exception>

namespace hdw::sched {

const char *state_name(State s) noexcept
{
    switch (s) {
        case State::starting:
            return "starting";
        case State::running:
            return "running";
        case State::shutting_down:
            return "shutting_down";
        case State::stopped:
            return "stopped";
    }
    return "stopped";
}

void Scheduler::set_state(State s)
{
    m_state.store(s, std::memory_order_release);
    log::debug("[sched] state -> {}", state_name(s));
}

void Scheduler::add_task(TaskSpec spec)
{
    Slot slot;
    slot.elapsed = spec.interval;
    slot.spec = std::move(spec);
    m_slots.push_back(std::move(slot));
}

std::vector<std::string> Scheduler::run_due(std::chrono::milliseconds elapsed)
{
    using clock = std::chrono::steady_clock;
    std::vector<std::string> ran;
    for (auto &slot : m_slots)
        slot.elapsed += elapsed;
    for (auto &slot : m_slots) {
        if (slot.elapsed < slot.spec.interval)
            continue;
        // Finish the in-flight task, but start nothing new once a stop was requested.
        if (m_stop.load(std::memory_order_acquire))
            break;
        auto *counters = slot.spec.counters;
        auto t0 = clock::now();
        try {
            slot.spec.fn();
        } catch (const std::exception &ex) {
            if (counters)
                counters->failures.fetch_add(1, std::memory_order_relaxed);
            log::error("[sched] task {} failed: {}", slot.spec.name, ex.what());
        }
        slot.elapsed = std::chrono::milliseconds{0};
        if (counters) {
            counters->runs.fetch_add(1, std::memory_order_relaxed);
            auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(clock::now() - t0).count();
            metrics::add_task_duration(*counters, static_cast<uint64_t>(ns));
        }
        ran.push_back(slot.spec.name);
    }
    return ran;
}

coro::task<int> Scheduler::run(std::shared_ptr<coro::io_scheduler> io, Lifecycle lifecycle)
{
    co_await io->schedule();
    set_state(State::starting);
    try {
        if (lifecycle.startup)
            lifecycle.startup();
    } catch (const std::exception &ex) {
        log::error("[sched] startup failed: {}", ex.what());
        set_state(State::stopped);
        co_return 1;
    }

    set_state(State::running);
    log::info("[sched] entering main loop (tick {}ms, {} tasks)", m_tick.count(), m_slots.size());
    using clock = std::chrono::steady_clock;
    auto last = clock::now();
    while (!m_stop.load(std::memory_order_acquire)) {
        auto now = clock::now();
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - last);
        last = now;
        run_due(elapsed);
        if (m_stop.load(std::memory_order_acquire))
            break;
        co_await io->yield_for(m_tick);
    }

    set_state(State::shutting_down);
    log::info("[sched] stop requested, shutting down");
    int rc = 0;
    try {
        if (lifecycle.shutdown)
            lifecycle.shutdown();
    } catch (const std::exception &ex) {
        log::error("[sched] shutdown failed: {}", ex.what());
        rc = 1;
    }
    set_state(State::stopped);
    co_return rc;
}

} // namespace hdw::sched
