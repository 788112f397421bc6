// SPDX-License-Identifier: Apache-2.0
#include "worker/retention/pruner.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

namespace hdw::retention {

PruneResult RetentionPruner::prune()
{
    const auto now = m_now();
    PruneResult r;
    r.samples_deleted = m_store.delete_samples_before(timeutil::to_epoch_seconds(now - m_cfg.perf_retention));
    r.events_deleted = m_store.delete_events_before(timeutil::to_epoch_seconds(now - m_cfg.event_retention));

    auto &rt = metrics::runtime();
    rt.samples_pruned.fetch_add(static_cast<uint64_t>(r.samples_deleted), std::memory_order_relaxed);
    rt.events_pruned.fetch_add(static_cast<uint64_t>(r.events_deleted), std::memory_order_relaxed);
    if (r.samples_deleted == 0 && r.events_deleted == 0) {
        log::debug("[prune] nothing to remove");
        return r;
    }

    log::info("[prune] removed {} perf records, {} events", r.samples_deleted, r.events_deleted);
    try {
        m_store.compact();
        r.compacted = true;
        rt.compactions.fetch_add(1, std::memory_order_relaxed);
    } catch (const store::StorageError &ex) {
        // Deletions are already committed; the next cleanup retries the checkpoint.
        log::warn("[prune] compaction skipped: {}", ex.what());
    }
    return r;
}

} // namespace hdw::retention
