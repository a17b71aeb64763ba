#include "lifecycle.hpp"
#include <string>

namespace mnemon {

Lifecycle state_of(const MemoryRecord& record) {
    if (!record.superseded_by) return Lifecycle::Active;
    int64_t target = *record.superseded_by;
    if (target == record.id || target <= 0) return Lifecycle::Retired;
    return Lifecycle::Superseded;
}

std::string lifecycle_to_string(Lifecycle state) {
    switch (state) {
        case Lifecycle::Active:     return "active";
        case Lifecycle::Superseded: return "superseded";
        case Lifecycle::Retired:    return "retired";
    }
    return "active";
}

static std::string memory_ref(int64_t id) {
    return "Memory #" + std::to_string(id);
}

OpResult retire(MemoryStore& store, int64_t id, RetireReason reason) {
    if (!store.exists(id)) {
        return OpResult::failure(MemoryError::NotFound, memory_ref(id) + " not found.");
    }

    int64_t marker = reason == RetireReason::Forgotten ? id : RETIRED_SENTINEL;
    bool changed = store.update(id, [marker](MemoryRecord& r) {
        if (state_of(r) != Lifecycle::Active) return false;
        r.superseded_by = marker;
        return true;
    });

    if (!changed) {
        return OpResult::failure(MemoryError::IllegalTransition,
                                 memory_ref(id) + " is not active.");
    }
    return OpResult::success(id, memory_ref(id) + " retired.");
}

OpResult supersede(MemoryStore& store, int64_t id, int64_t replacement_id) {
    if (id == replacement_id) {
        return OpResult::failure(MemoryError::IllegalTransition,
                                 memory_ref(id) + " cannot supersede itself.");
    }
    if (!store.exists(id)) {
        return OpResult::failure(MemoryError::NotFound, memory_ref(id) + " not found.");
    }
    if (replacement_id <= 0 || !store.exists(replacement_id)) {
        return OpResult::failure(MemoryError::NotFound,
                                 memory_ref(replacement_id) + " not found.");
    }

    bool changed = store.update(id, [replacement_id](MemoryRecord& r) {
        if (state_of(r) != Lifecycle::Active) return false;
        r.superseded_by = replacement_id;
        return true;
    });

    if (!changed) {
        return OpResult::failure(MemoryError::IllegalTransition,
                                 memory_ref(id) + " is not active.");
    }
    return OpResult::success(id, memory_ref(id) + " superseded by #" +
                                 std::to_string(replacement_id) + ".");
}

} // namespace mnemon
