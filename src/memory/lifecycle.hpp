#pragma once
#include "../memory.hpp"
#include <cstdint>
#include <string>

namespace mnemon {

// Active    superseded_by = null
// Superseded superseded_by = id of a different record
// Retired   superseded_by = own id (forgotten) or RETIRED_SENTINEL (decayed)
//
// Superseded and Retired are terminal: nothing leads back to Active.

enum class RetireReason { Forgotten, Decayed };

Lifecycle state_of(const MemoryRecord& record);

std::string lifecycle_to_string(Lifecycle state);

// Active -> Retired. NotFound if the id is unknown, IllegalTransition if the
// record is no longer Active (checked inside the row transaction).
OpResult retire(MemoryStore& store, int64_t id, RetireReason reason);

// Active -> Superseded by replacement_id. The replacement must exist and
// differ from id.
OpResult supersede(MemoryStore& store, int64_t id, int64_t replacement_id);

} // namespace mnemon
