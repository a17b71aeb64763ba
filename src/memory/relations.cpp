#include "relations.hpp"
#include "lifecycle.hpp"
#include "../util.hpp"
#include <algorithm>

namespace mnemon {

static constexpr double kCorrectionMinImportance = 0.7;
static constexpr double kCorrectionConfidence = 0.9;

static std::string memory_ref(int64_t id) {
    return "Memory #" + std::to_string(id);
}

OpResult correct(MemoryStore& store, const CorrectionRequest& request) {
    std::string content = trim(request.new_content);
    if (content.empty()) {
        return OpResult::failure(MemoryError::InvalidContent,
                                 "Corrected content must not be empty");
    }

    OpResult result;
    store.transaction([&]() {
        auto old = store.get(request.old_id);
        if (!old) {
            result = OpResult::failure(MemoryError::NotFound,
                                       memory_ref(request.old_id) + " not found.");
            return;
        }
        if (state_of(*old) != Lifecycle::Active) {
            result = OpResult::failure(MemoryError::IllegalTransition,
                memory_ref(request.old_id) + " is " + lifecycle_to_string(state_of(*old)) +
                " and cannot be corrected.");
            return;
        }

        NewRecord rec;
        rec.content = content;
        rec.category = old->category;
        rec.project = old->project;
        rec.importance = std::max(old->importance, kCorrectionMinImportance);
        rec.confidence = kCorrectionConfidence;
        rec.context = request.reason ? request.reason
                                     : std::optional<std::string>(
                                           "Correction of #" + std::to_string(request.old_id));
        rec.tags = old->tags;
        rec.source_session = request.session_id;

        int64_t new_id = store.create(rec);
        store.add_relation({new_id, request.old_id, RelationType::Supersedes});

        OpResult flipped = supersede(store, request.old_id, new_id);
        if (!flipped.ok()) {
            // Unreachable while the transaction holds the row; roll back rather
            // than leave a dangling replacement.
            throw StoreError("correct: " + flipped.message);
        }

        result = OpResult::success(new_id, memory_ref(request.old_id) +
                                   " superseded by #" + std::to_string(new_id) + ": " + content);
    });
    return result;
}

OpResult forget(MemoryStore& store, int64_t id) {
    std::string content;
    if (auto record = store.get(id)) content = record->content;

    OpResult res = retire(store, id, RetireReason::Forgotten);
    if (!res.ok()) {
        return OpResult::failure(MemoryError::NotFound,
                                 memory_ref(id) + " not found or already forgotten.");
    }
    return OpResult::success(id, "Forgotten memory #" + std::to_string(id) + ": " + content);
}

OpResult relate(MemoryStore& store, int64_t from_id, int64_t to_id,
                const std::string& relation) {
    auto type = relation_type_from_string(relation);
    if (!type) {
        std::string names;
        for (const auto& n : relation_type_names()) {
            if (!names.empty()) names += ", ";
            names += n;
        }
        return OpResult::failure(MemoryError::InvalidRelationType,
            "Invalid relation '" + relation + "'. Use one of: " + names);
    }

    for (int64_t id : {from_id, to_id}) {
        if (!store.exists(id)) {
            return OpResult::failure(MemoryError::NotFound, memory_ref(id) + " not found.");
        }
    }

    store.add_relation({from_id, to_id, *type});
    return OpResult::success(from_id, "Linked #" + std::to_string(from_id) + " --" +
                                          relation + "--> #" + std::to_string(to_id));
}

} // namespace mnemon
