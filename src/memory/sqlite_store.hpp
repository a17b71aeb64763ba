#pragma once
#include "../memory.hpp"
#include <mutex>
#include <string>

struct sqlite3; // forward declare

namespace mnemon {

// SQLite-backed record store: memories + tags + relations, with an FTS5
// index kept in sync by triggers. Opening the store creates the schema
// idempotently; failure to open throws StoreError.
class SqliteStore : public MemoryStore {
public:
    explicit SqliteStore(const std::string& path);
    ~SqliteStore() override;

    // Non-copyable
    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    std::string backend_name() const override { return "sqlite"; }

    int64_t create(const NewRecord& record) override;
    std::optional<MemoryRecord> get(int64_t id) override;
    bool exists(int64_t id) override;
    bool update(int64_t id, const RecordMutator& mutator) override;

    std::vector<MemoryRecord> query(const RecordFilter& filter, RecordOrder order,
                                    uint32_t limit) override;
    std::vector<SearchHit> search(const std::string& query, const RecordFilter& filter,
                                  uint32_t limit) override;

    void touch(const std::vector<int64_t>& ids) override;

    std::vector<std::string> tags(int64_t id) override;
    void add_tags(int64_t id, const std::vector<std::string>& tags) override;

    bool add_relation(const Relation& relation) override;
    std::vector<Relation> relations(int64_t id) override;

    StoreStats stats() override;

    void transaction(const std::function<void()>& fn) override;

    const std::string& path() const { return path_; }

private:
    void init_schema();
    void exec(const char* sql);
    bool has_column(const char* table, const char* column);
    std::optional<MemoryRecord> load_record(int64_t id);
    void populate_tags(std::vector<MemoryRecord>& records);

    sqlite3* db_ = nullptr;
    std::string path_;
    // Recursive so operations can run inside transaction() on the same thread.
    mutable std::recursive_mutex mutex_;
    int tx_depth_ = 0;
};

} // namespace mnemon
