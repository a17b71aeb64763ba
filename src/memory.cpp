#include "memory.hpp"
#include "memory/record_json.hpp"
#include "memory/scoring.hpp"
#include "util.hpp"
#include <algorithm>
#include <nlohmann/json.hpp>
#include <sstream>

namespace mnemon {

std::string category_to_string(Category cat) {
    switch (cat) {
        case Category::Preferences:      return "preferences";
        case Category::Facts:            return "facts";
        case Category::Corrections:      return "corrections";
        case Category::Decisions:        return "decisions";
        case Category::ProjectKnowledge: return "project-knowledge";
        case Category::Relationships:    return "relationships";
        case Category::Procedures:       return "procedures";
    }
    return "facts";
}

std::optional<Category> category_from_string(const std::string& s) {
    if (s == "preferences")       return Category::Preferences;
    if (s == "facts")             return Category::Facts;
    if (s == "corrections")       return Category::Corrections;
    if (s == "decisions")         return Category::Decisions;
    if (s == "project-knowledge") return Category::ProjectKnowledge;
    if (s == "relationships")     return Category::Relationships;
    if (s == "procedures")        return Category::Procedures;
    return std::nullopt;
}

const std::vector<std::string>& category_names() {
    static const std::vector<std::string> names = {
        "corrections", "decisions", "facts", "preferences",
        "procedures", "project-knowledge", "relationships"
    };
    return names;
}

std::string relation_type_to_string(RelationType type) {
    switch (type) {
        case RelationType::Contradicts: return "contradicts";
        case RelationType::Supports:    return "supports";
        case RelationType::Refines:     return "refines";
        case RelationType::Supersedes:  return "supersedes";
    }
    return "supports";
}

std::optional<RelationType> relation_type_from_string(const std::string& s) {
    if (s == "contradicts") return RelationType::Contradicts;
    if (s == "supports")    return RelationType::Supports;
    if (s == "refines")     return RelationType::Refines;
    if (s == "supersedes")  return RelationType::Supersedes;
    return std::nullopt;
}

const std::vector<std::string>& relation_type_names() {
    static const std::vector<std::string> names = {
        "contradicts", "refines", "supersedes", "supports"
    };
    return names;
}

std::string error_to_string(MemoryError error) {
    switch (error) {
        case MemoryError::None:                return "ok";
        case MemoryError::NotFound:            return "not_found";
        case MemoryError::InvalidCategory:     return "invalid_category";
        case MemoryError::InvalidRelationType: return "invalid_relation_type";
        case MemoryError::InvalidContent:      return "invalid_content";
        case MemoryError::IllegalTransition:   return "illegal_transition";
        case MemoryError::StoreUnavailable:    return "store_unavailable";
    }
    return "unknown";
}

std::optional<ListSort> list_sort_from_string(const std::string& s) {
    if (s == "score")      return ListSort::Score;
    if (s == "recency")    return ListSort::Recency;
    if (s == "importance") return ListSort::Importance;
    if (s == "accessed")   return ListSort::Accessed;
    return std::nullopt;
}

double clamp_unit(double v) {
    if (!(v >= 0.0)) return 0.0;   // also maps NaN to 0
    if (v > 1.0) return 1.0;
    return v;
}

std::string normalize_content(const std::string& content) {
    return to_lower(trim(content));
}

std::string normalize_tag(const std::string& tag) {
    return to_lower(trim(tag));
}

static std::string join_names(const std::vector<std::string>& names) {
    std::string out;
    for (size_t i = 0; i < names.size(); i++) {
        if (i > 0) out += ", ";
        out += names[i];
    }
    return out;
}

OpResult remember(MemoryStore& store, const RememberRequest& request) {
    auto category = category_from_string(request.category);
    if (!category) {
        return OpResult::failure(MemoryError::InvalidCategory,
            "Invalid category '" + request.category + "'. Use one of: " +
            join_names(category_names()));
    }

    std::string content = trim(request.content);
    if (content.empty()) {
        return OpResult::failure(MemoryError::InvalidContent, "Memory content must not be empty");
    }

    NewRecord rec;
    rec.content = content;
    rec.category = *category;
    rec.project = request.project;
    rec.context = request.context;
    rec.importance = clamp_unit(request.importance);
    rec.confidence = clamp_unit(request.confidence);
    rec.tags = request.tags;
    rec.source_session = request.session_id;

    int64_t id = store.create(rec);

    std::ostringstream ss;
    ss << "Stored memory #" << id << " [" << request.category << "] (importance="
       << rec.importance << ", confidence=" << rec.confidence << ")";
    return OpResult::success(id, ss.str());
}

static bool matches_filter(const MemoryRecord& record, const RecordFilter& filter) {
    if (!filter.include_inactive && record.superseded_by) return false;
    if (filter.category && record.category != *filter.category) return false;
    if (filter.project && record.project && *record.project != *filter.project) return false;
    return true;
}

std::vector<MemoryRecord> recall(MemoryStore& store, const RecallRequest& request) {
    if (trim(request.query).empty() || request.limit == 0) return {};

    auto hits = store.search(request.query, request.filter, request.limit);

    std::vector<MemoryRecord> results;
    std::vector<int64_t> touched;
    for (const auto& hit : hits) {
        auto record = store.get(hit.id);
        // The oracle may be stale; lifecycle filtering is ours to enforce.
        if (!record || !matches_filter(*record, request.filter)) continue;
        record->score = hit.relevance;
        touched.push_back(record->id);
        results.push_back(std::move(*record));
        if (results.size() >= request.limit) break;
    }

    store.touch(touched);
    return results;
}

static RecordOrder to_record_order(ListSort sort) {
    switch (sort) {
        case ListSort::Recency:    return RecordOrder::Recency;
        case ListSort::Importance: return RecordOrder::Importance;
        case ListSort::Accessed:   return RecordOrder::Accessed;
        case ListSort::Score:      break;
    }
    return RecordOrder::Id;
}

std::vector<MemoryRecord> list_memories(MemoryStore& store, const RecordFilter& filter,
                                        ListSort sort, uint32_t limit, uint64_t now) {
    RecordFilter active = filter;
    active.include_inactive = false;

    std::vector<MemoryRecord> records;
    if (sort == ListSort::Score) {
        records = store.query(active, RecordOrder::Id, 0);
        rank_records(records, now);
        if (limit > 0 && records.size() > limit) records.resize(limit);
    } else {
        records = store.query(active, to_record_order(sort), limit);
        for (auto& r : records) r.score = score_record(r, now);
    }

    std::vector<int64_t> ids;
    ids.reserve(records.size());
    for (const auto& r : records) ids.push_back(r.id);
    store.touch(ids);

    return records;
}

std::string snapshot_export(MemoryStore& store) {
    RecordFilter all;
    all.include_inactive = true;
    auto records = store.query(all, RecordOrder::Id, 0);

    nlohmann::json arr = nlohmann::json::array();
    for (const auto& record : records) {
        nlohmann::json item = record_to_json_full(record);
        nlohmann::json edges = nlohmann::json::array();
        for (const auto& rel : store.relations(record.id)) {
            if (rel.from_id == record.id) edges.push_back(relation_to_json(rel));
        }
        item["relations"] = edges;
        arr.push_back(std::move(item));
    }
    return arr.dump(2);
}

} // namespace mnemon
