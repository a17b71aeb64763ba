#pragma once
#include "../memory.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace mnemon {

// Relevance score:
//   importance * confidence * frequency_boost * time_decay
// Pure: no I/O, no mutation, same inputs give the same bits.

// 1 + 0.1 per recorded access
double frequency_boost(uint32_t access_count);

// 0.998 ^ age_hours, clamped to age >= 0. Unparseable created_at yields 0.5.
double time_decay(const std::string& created_at, uint64_t now);

double score_record(const MemoryRecord& record, uint64_t now);

// Fill each record's score and sort best first (ties: lowest id first).
void rank_records(std::vector<MemoryRecord>& records, uint64_t now);

} // namespace mnemon
