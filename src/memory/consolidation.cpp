#include "consolidation.hpp"
#include "lifecycle.hpp"
#include "sqlite_store.hpp"
#include "../util.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <map>

namespace mnemon {

static constexpr uint64_t kSecondsPerDay = 86400;

static bool is_idle_for(const MemoryRecord& r, uint32_t days, uint64_t now) {
    auto created = parse_timestamp(r.created_at);
    if (!created || now < *created) return false;
    return now - *created >= static_cast<uint64_t>(days) * kSecondsPerDay;
}

static bool decayed_recently(const MemoryRecord& r, uint32_t window_days, uint64_t now) {
    if (r.decayed_at.empty()) return false;
    auto decayed = parse_timestamp(r.decayed_at);
    if (!decayed) return false;
    if (now < *decayed) return true;
    return now - *decayed < static_cast<uint64_t>(window_days) * kSecondsPerDay;
}

static bool should_decay(const MemoryRecord& r, const ConsolidationConfig& p, uint64_t now) {
    return state_of(r) == Lifecycle::Active &&
           r.access_count == 0 &&
           r.importance > p.decay_floor &&
           is_idle_for(r, p.decay_age_days, now) &&
           !decayed_recently(r, p.decay_age_days, now);
}

static bool should_retire(const MemoryRecord& r, const ConsolidationConfig& p, uint64_t now) {
    return state_of(r) == Lifecycle::Active &&
           r.access_count == 0 &&
           r.importance < p.retire_threshold &&
           is_idle_for(r, p.retire_age_days, now);
}

static uint32_t decay_pass(MemoryStore& store, const ConsolidationConfig& p, uint64_t now) {
    uint32_t decayed = 0;
    std::string stamp = format_timestamp(now);
    for (const auto& r : store.query(RecordFilter{}, RecordOrder::Id, 0)) {
        if (!should_decay(r, p, now)) continue;
        bool changed = store.update(r.id, [&](MemoryRecord& row) {
            if (!should_decay(row, p, now)) return false;
            row.importance *= p.decay_factor;
            row.decayed_at = stamp;
            return true;
        });
        if (changed) decayed++;
    }
    return decayed;
}

static uint32_t retire_pass(MemoryStore& store, const ConsolidationConfig& p, uint64_t now) {
    uint32_t retired = 0;
    for (const auto& r : store.query(RecordFilter{}, RecordOrder::Id, 0)) {
        if (!should_retire(r, p, now)) continue;
        bool changed = store.update(r.id, [&](MemoryRecord& row) {
            if (!should_retire(row, p, now)) return false;
            row.superseded_by = RETIRED_SENTINEL;
            return true;
        });
        if (changed) retired++;
    }
    return retired;
}

// Keeper order: more accesses, then higher importance, then lower id.
static bool keeper_less(const MemoryRecord& a, const MemoryRecord& b) {
    if (a.access_count != b.access_count) return a.access_count < b.access_count;
    if (a.importance != b.importance) return a.importance < b.importance;
    return a.id > b.id;
}

static uint32_t dedup_pass(MemoryStore& store) {
    std::map<std::string, std::vector<MemoryRecord>> groups;
    for (auto& r : store.query(RecordFilter{}, RecordOrder::Id, 0)) {
        groups[normalize_content(r.content)].push_back(std::move(r));
    }

    uint32_t merged = 0;
    for (const auto& [key, members] : groups) {
        if (members.size() < 2) continue;

        const auto& keeper = *std::max_element(members.begin(), members.end(), keeper_less);
        for (const auto& m : members) {
            if (m.id == keeper.id) continue;
            OpResult res = supersede(store, m.id, keeper.id);
            if (res.ok()) {
                merged++;
            } else if (res.error != MemoryError::IllegalTransition) {
                std::cerr << "[consolidate] Skipped merge of #" << m.id
                          << " into #" << keeper.id << ": " << res.message << "\n";
            }
        }
    }
    return merged;
}

ConsolidationReport consolidate(MemoryStore& store, const ConsolidationConfig& policy,
                                uint64_t now) {
    ConsolidationReport report;
    report.decayed = decay_pass(store, policy, now);
    report.retired = retire_pass(store, policy, now);
    report.merged = dedup_pass(store);
    return report;
}

bool run_maintenance(const Config& config, ConsolidationReport* report) {
    std::string path = config.db_path();
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return false;   // nothing stored yet

    try {
        SqliteStore store(path);
        ConsolidationReport result = consolidate(store, config.consolidation, epoch_seconds());
        std::cerr << "[consolidate] decayed " << result.decayed
                  << ", retired " << result.retired
                  << ", merged " << result.merged << "\n";
        if (report) *report = result;
        return true;
    } catch (const StoreError& e) {
        std::cerr << "[consolidate] Store unavailable, skipping sweep: " << e.what() << "\n";
        return false;
    }
}

} // namespace mnemon
