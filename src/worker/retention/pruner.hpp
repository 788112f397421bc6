// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "common/time_util.hpp"
#include "worker/store/store.hpp"

#include <chrono>

namespace hdw::retention {

struct RetentionConfig
{
    std::chrono::hours perf_retention{24};
    std::chrono::hours event_retention{168};
};

struct PruneResult
{
    int samples_deleted{0};
    int events_deleted{0};
    bool compacted{false};
};

// Age-based deletion of performance samples and event history, each with its own horizon.
class RetentionPruner
{
public:
    RetentionPruner(store::Store &store, RetentionConfig cfg, timeutil::now_fn now)
        : m_store(store), m_cfg(cfg), m_now(std::move(now))
    {}

    PruneResult prune();

private:
    store::Store &m_store;
    RetentionConfig m_cfg;
    timeutil::now_fn m_now;
};

} // namespace hdw::retention
