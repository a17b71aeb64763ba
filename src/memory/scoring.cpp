#include "scoring.hpp"
#include "../util.hpp"
#include <algorithm>
#include <cmath>

namespace mnemon {

static constexpr double kAccessBoost = 0.1;
static constexpr double kHourlyDecay = 0.998;
static constexpr double kUnknownAgeDecay = 0.5;

double frequency_boost(uint32_t access_count) {
    return 1.0 + static_cast<double>(access_count) * kAccessBoost;
}

double time_decay(const std::string& created_at, uint64_t now) {
    auto created = parse_timestamp(created_at);
    if (!created) return kUnknownAgeDecay;

    double age_hours = 0.0;
    if (now > *created) {
        age_hours = static_cast<double>(now - *created) / 3600.0;
    }
    return std::pow(kHourlyDecay, age_hours);
}

double score_record(const MemoryRecord& record, uint64_t now) {
    return record.importance * record.confidence *
           frequency_boost(record.access_count) *
           time_decay(record.created_at, now);
}

void rank_records(std::vector<MemoryRecord>& records, uint64_t now) {
    for (auto& r : records) {
        r.score = score_record(r, now);
    }
    std::sort(records.begin(), records.end(),
              [](const MemoryRecord& a, const MemoryRecord& b) {
                  if (a.score != b.score) return a.score > b.score;
                  return a.id < b.id;
              });
}

} // namespace mnemon
