#pragma once
#include "../memory.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace mnemon {

struct CorrectionRequest {
    int64_t old_id = 0;
    std::string new_content;
    std::optional<std::string> reason;
    std::string session_id;
};

// Replace an Active record with a corrected one. In one transaction: create
// the new record (category, project and tags carried over, importance at
// least 0.7, confidence 0.9), link new --supersedes--> old, then mark the old
// record Superseded. On success OpResult::id is the new record id.
OpResult correct(MemoryStore& store, const CorrectionRequest& request);

// Active -> Retired (own id as marker). Non-Active and unknown ids report
// NotFound and change nothing.
OpResult forget(MemoryStore& store, int64_t id);

// Typed edge between two existing records. Duplicate triples are accepted
// and stored once.
OpResult relate(MemoryStore& store, int64_t from_id, int64_t to_id,
                const std::string& relation);

} // namespace mnemon
