// SPDX-License-Identifier: Apache-2.0
// scheduler.hpp
// Single control loop running independent periodic tasks (perf sampling, ingestion, cleanup).
#pragma once

#include "common/metrics.hpp"

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace hdw::sched {

enum class State
{
    starting,
    running,
    shutting_down,
    stopped
};

const char *state_name(State s) noexcept;

struct TaskSpec
{
    std::string name;
    std::chrono::milliseconds interval{1000};
    std::function<void()> fn;
    metrics::TaskCounters *counters{nullptr}; // optional
};

struct Lifecycle
{
    std::function<void()> startup; // open storage, schema, backfill; an exception here is fatal
    std::function<void()> shutdown; // close storage
};

class Scheduler
{
public:
    Scheduler(std::chrono::milliseconds tick, std::atomic_bool &stop) : m_tick(tick), m_stop(stop) {}

    // Tasks run in registration order within one iteration. Each starts due on the first iteration.
    void add_task(TaskSpec spec);

    // Adds elapsed to every task's timer; runs each task whose timer reached its interval and resets
    // only that timer. No catch-up: a task is run at most once per call however late it is.
    // A failing task is logged and counted; the remaining tasks still run. Returns names run.
    std::vector<std::string> run_due(std::chrono::milliseconds elapsed);

    // Starting -> Running -> ShuttingDown -> Stopped. Returns the process exit code
    // (1 when startup failed, 0 otherwise).
    coro::task<int> run(std::shared_ptr<coro::io_scheduler> io, Lifecycle lifecycle);

    State state() const noexcept { return m_state.load(std::memory_order_acquire); }

private:
    struct Slot
    {
        TaskSpec spec;
        std::chrono::milliseconds elapsed{0};
    };

    void set_state(State s);

    std::chrono::milliseconds m_tick;
    std::atomic_bool &m_stop;
    std::atomic<State> m_state{State::stopped};
    std::vector<Slot> m_slots;
};

} // namespace hdw::sched
