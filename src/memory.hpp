#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <functional>
#include <map>
#include <stdexcept>
#include <utility>

namespace mnemon {

enum class Category {
    Preferences,
    Facts,
    Corrections,
    Decisions,
    ProjectKnowledge,
    Relationships,
    Procedures
};

enum class RelationType { Contradicts, Supports, Refines, Supersedes };

enum class Lifecycle { Active, Superseded, Retired };

enum class MemoryError {
    None,
    NotFound,
    InvalidCategory,
    InvalidRelationType,
    InvalidContent,
    IllegalTransition,
    StoreUnavailable
};

// superseded_by value for records retired by decay (no replacement)
constexpr int64_t RETIRED_SENTINEL = -1;

struct MemoryRecord {
    int64_t id = 0;
    Category category = Category::Facts;
    std::string content;
    std::optional<std::string> context;
    std::optional<std::string> project;   // nullopt = global
    double importance = 0.5;
    double confidence = 0.8;
    uint32_t access_count = 0;
    std::string last_accessed;            // empty = never accessed
    std::string created_at;
    std::string updated_at;
    std::string decayed_at;               // empty = never decayed
    std::string source_session;
    std::optional<int64_t> superseded_by;
    std::vector<std::string> tags;
    double score = 0.0;                   // filled in by read paths only
};

// Input for MemoryStore::create. created_at is normally left empty (= now);
// imports and tests may backdate it.
struct NewRecord {
    std::string content;
    Category category = Category::Facts;
    std::optional<std::string> project;
    std::optional<std::string> context;
    double importance = 0.5;
    double confidence = 0.8;
    std::vector<std::string> tags;
    std::string source_session;
    std::string created_at;
};

struct Relation {
    int64_t from_id = 0;
    int64_t to_id = 0;
    RelationType type = RelationType::Supports;
};

struct RecordFilter {
    std::optional<Category> category;
    std::optional<std::string> project;   // matches the project and global records
    bool include_inactive = false;
};

enum class RecordOrder { Id, Recency, Importance, Accessed };

// Ordering accepted by list_memories; Score is computed, the rest map to RecordOrder.
enum class ListSort { Score, Recency, Importance, Accessed };

struct SearchHit {
    int64_t id = 0;
    double relevance = 0.0;
};

struct StoreStats {
    uint32_t total_active = 0;
    uint32_t total_superseded = 0;
    uint32_t total_retired = 0;
    std::map<std::string, uint32_t> by_category;
    std::map<std::string, uint32_t> by_project;   // "global" for records without a project
    std::vector<MemoryRecord> most_accessed;
};

// Outcome of a core operation. Expected failures (unknown ids, bad input,
// illegal transitions) are reported here rather than thrown.
struct OpResult {
    MemoryError error = MemoryError::None;
    int64_t id = 0;
    std::string message;

    bool ok() const { return error == MemoryError::None; }

    static OpResult success(int64_t id, std::string message) {
        return OpResult{MemoryError::None, id, std::move(message)};
    }
    static OpResult failure(MemoryError error, std::string message) {
        return OpResult{error, 0, std::move(message)};
    }
};

// Raised when the persistence layer cannot be opened or a statement fails.
class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Returns false to leave the row untouched.
using RecordMutator = std::function<bool(MemoryRecord&)>;

// Abstract record store. The single source of truth shared by scoring,
// lifecycle, consolidation and correction code.
class MemoryStore {
public:
    virtual ~MemoryStore() = default;

    virtual std::string backend_name() const = 0;

    // Insert a new Active record with its tags. Returns the assigned id.
    virtual int64_t create(const NewRecord& record) = 0;

    // Fetch a record (any lifecycle state) with its tags.
    virtual std::optional<MemoryRecord> get(int64_t id) = 0;

    virtual bool exists(int64_t id) = 0;

    // Read-modify-write of one row inside a transaction. Only mutable fields
    // (importance, access_count, last_accessed, decayed_at, superseded_by) are
    // written back, and updated_at is bumped. Returns true if the row changed.
    virtual bool update(int64_t id, const RecordMutator& mutator) = 0;

    // Filtered listing. limit 0 = no limit.
    virtual std::vector<MemoryRecord> query(const RecordFilter& filter,
                                            RecordOrder order,
                                            uint32_t limit) = 0;

    // Full-text search oracle. Hits are ordered best first.
    virtual std::vector<SearchHit> search(const std::string& query,
                                          const RecordFilter& filter,
                                          uint32_t limit) = 0;

    // Access bookkeeping: one increment per id, never lost under concurrency.
    virtual void touch(const std::vector<int64_t>& ids) = 0;

    virtual std::vector<std::string> tags(int64_t id) = 0;
    virtual void add_tags(int64_t id, const std::vector<std::string>& tags) = 0;

    // Insert-or-ignore. Returns true if a new edge was stored.
    virtual bool add_relation(const Relation& relation) = 0;

    // Edges where the record is either endpoint.
    virtual std::vector<Relation> relations(int64_t id) = 0;

    virtual StoreStats stats() = 0;

    // Run fn atomically. Nested calls join the outer transaction.
    // An exception from fn rolls back and is rethrown.
    virtual void transaction(const std::function<void()>& fn) = 0;
};

// Category / relation / error string conversions
std::string category_to_string(Category cat);
std::optional<Category> category_from_string(const std::string& s);
const std::vector<std::string>& category_names();   // sorted

std::string relation_type_to_string(RelationType type);
std::optional<RelationType> relation_type_from_string(const std::string& s);
const std::vector<std::string>& relation_type_names();   // sorted

std::string error_to_string(MemoryError error);

std::optional<ListSort> list_sort_from_string(const std::string& s);

// Clamp a caller-declared importance/confidence into [0,1]
double clamp_unit(double v);

// Deduplication key: lower-cased, whitespace-trimmed content
std::string normalize_content(const std::string& content);

// Tags are stored trimmed and lower-cased
std::string normalize_tag(const std::string& tag);

// ── Caller operations ────────────────────────────────────────

struct RememberRequest {
    std::string content;
    std::string category = "facts";
    std::optional<std::string> project;
    double importance = 0.5;
    double confidence = 0.8;
    std::vector<std::string> tags;
    std::optional<std::string> context;
    std::string session_id;
};

// Validate and store a new memory.
OpResult remember(MemoryStore& store, const RememberRequest& request);

struct RecallRequest {
    std::string query;
    RecordFilter filter;
    uint32_t limit = 10;
};

// Search through the oracle, re-apply lifecycle filtering, bump access counts.
// Returned records carry the access_count as it was before this retrieval.
std::vector<MemoryRecord> recall(MemoryStore& store, const RecallRequest& request);

// List active records. Score ordering uses the scoring function at `now`.
std::vector<MemoryRecord> list_memories(MemoryStore& store, const RecordFilter& filter,
                                        ListSort sort, uint32_t limit, uint64_t now);

// JSON snapshot of every record (any state) with tags and outgoing relations.
std::string snapshot_export(MemoryStore& store);

} // namespace mnemon
