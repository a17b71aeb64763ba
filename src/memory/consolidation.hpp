#pragma once
#include "../memory.hpp"
#include "../config.hpp"
#include <cstdint>

namespace mnemon {

struct ConsolidationReport {
    uint32_t decayed = 0;
    uint32_t retired = 0;
    uint32_t merged = 0;
};

// One maintenance sweep over the active set, in order:
//   1. decay      idle (never accessed) records older than decay_age_days lose
//                 importance by decay_factor, at most once per decay_age_days
//   2. retire     idle records older than retire_age_days whose importance
//                 fell below retire_threshold are retired (RETIRED_SENTINEL)
//   3. dedup      active records with equal normalized content collapse onto
//                 the one with the highest (access_count, importance), lowest
//                 id on ties
// Every row change is its own transaction; the predicate is re-checked inside
// it, so records changed concurrently are skipped. Running the sweep twice at
// the same `now` changes nothing the second time.
ConsolidationReport consolidate(MemoryStore& store, const ConsolidationConfig& policy,
                                uint64_t now);

// Out-of-band entry point: open the configured store and sweep it.
// An unavailable store is logged and skipped. Returns false if nothing ran.
bool run_maintenance(const Config& config, ConsolidationReport* report = nullptr);

} // namespace mnemon
