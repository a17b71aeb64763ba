#pragma once
#include "../memory.hpp"
#include <nlohmann/json.hpp>

namespace mnemon {

// MemoryRecord -> JSON, shared by snapshot export and the tool boundary.
// Optional fields are emitted as null so consumers see a stable shape.

inline nlohmann::json record_to_json(const MemoryRecord& record) {
    nlohmann::json item = {
        {"id", record.id},
        {"content", record.content},
        {"category", category_to_string(record.category)},
        {"project", record.project ? nlohmann::json(*record.project) : nlohmann::json()},
        {"importance", record.importance},
        {"confidence", record.confidence},
        {"access_count", record.access_count},
        {"created_at", record.created_at}
    };
    if (!record.tags.empty()) {
        item["tags"] = record.tags;
    }
    return item;
}

// Full form, including lifecycle and provenance fields.
inline nlohmann::json record_to_json_full(const MemoryRecord& record) {
    nlohmann::json item = record_to_json(record);
    item["context"] = record.context ? nlohmann::json(*record.context) : nlohmann::json();
    item["last_accessed"] = record.last_accessed.empty()
        ? nlohmann::json() : nlohmann::json(record.last_accessed);
    item["updated_at"] = record.updated_at;
    item["decayed_at"] = record.decayed_at.empty()
        ? nlohmann::json() : nlohmann::json(record.decayed_at);
    item["source_session"] = record.source_session;
    item["superseded_by"] = record.superseded_by
        ? nlohmann::json(*record.superseded_by) : nlohmann::json();
    item["tags"] = record.tags;
    return item;
}

inline nlohmann::json relation_to_json(const Relation& relation) {
    return {
        {"from_id", relation.from_id},
        {"to_id", relation.to_id},
        {"relation", relation_type_to_string(relation.type)}
    };
}

} // namespace mnemon
