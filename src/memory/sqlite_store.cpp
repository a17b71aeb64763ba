#include "sqlite_store.hpp"
#include "../util.hpp"
#include <sqlite3.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace mnemon {

// Preprocess a user query for FTS5: split on non-alphanumeric, skip
// single-char tokens, quote each token so FTS5 keywords (AND, NOT, NEAR)
// stay literal, and OR-join them so any matching token produces results.
static std::string build_fts_query(const std::string& query) {
    std::string result;
    std::string token;
    auto flush = [&]() {
        if (token.size() >= 2) {
            if (!result.empty()) result += " OR ";
            result += "\"" + token + "\"";
        }
        token.clear();
    };
    for (char c : query) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            token += c;
        } else {
            flush();
        }
    }
    flush();
    return result;
}

// Substring pattern for LIKE ... ESCAPE '\'. Wildcards in the query match literally.
static std::string build_like_pattern(const std::string& query) {
    std::string pat = "%";
    for (char c : query) {
        if (c == '%' || c == '_' || c == '\\') pat += '\\';
        pat += c;
    }
    pat += '%';
    return pat;
}

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

static const char* kRecordColumns =
    "m.id, m.category, m.content, m.context, m.project, m.importance, m.confidence,"
    " m.access_count, m.last_accessed, m.created_at, m.updated_at, m.decayed_at,"
    " m.source_session, m.superseded_by";

static void prepare(sqlite3* db, const std::string& sql, StmtGuard& g) {
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw StoreError(std::string("SqliteStore: prepare failed: ") + sqlite3_errmsg(db));
    }
}

static void step_done(sqlite3* db, StmtGuard& g) {
    int rc = sqlite3_step(g.stmt);
    if (rc != SQLITE_DONE && rc != SQLITE_ROW) {
        throw StoreError(std::string("SqliteStore: statement failed: ") + sqlite3_errmsg(db));
    }
}

static void check_row_loop(sqlite3* db, int rc) {
    if (rc != SQLITE_DONE) {
        throw StoreError(std::string("SqliteStore: query failed: ") + sqlite3_errmsg(db));
    }
}

static void bind_optional_text(sqlite3_stmt* stmt, int col, const std::optional<std::string>& v) {
    if (v) {
        sqlite3_bind_text(stmt, col, v->c_str(), -1, SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt, col);
    }
}

static void bind_text_or_null(sqlite3_stmt* stmt, int col, const std::string& v) {
    if (v.empty()) {
        sqlite3_bind_null(stmt, col);
    } else {
        sqlite3_bind_text(stmt, col, v.c_str(), -1, SQLITE_TRANSIENT);
    }
}

static std::string column_string(sqlite3_stmt* stmt, int col) {
    if (auto* v = sqlite3_column_text(stmt, col)) return reinterpret_cast<const char*>(v);
    return {};
}

static std::optional<std::string> column_optional(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    return column_string(stmt, col);
}

// Read a MemoryRecord from a statement selecting kRecordColumns (columns 0-13).
static MemoryRecord record_from_stmt(sqlite3_stmt* stmt) {
    MemoryRecord r;
    r.id = sqlite3_column_int64(stmt, 0);
    r.category = category_from_string(column_string(stmt, 1)).value_or(Category::Facts);
    r.content = column_string(stmt, 2);
    r.context = column_optional(stmt, 3);
    r.project = column_optional(stmt, 4);
    r.importance = sqlite3_column_double(stmt, 5);
    r.confidence = sqlite3_column_double(stmt, 6);
    r.access_count = static_cast<uint32_t>(std::max<int64_t>(0, sqlite3_column_int64(stmt, 7)));
    r.last_accessed = column_string(stmt, 8);
    r.created_at = column_string(stmt, 9);
    r.updated_at = column_string(stmt, 10);
    r.decayed_at = column_string(stmt, 11);
    r.source_session = column_string(stmt, 12);
    if (sqlite3_column_type(stmt, 13) != SQLITE_NULL) {
        r.superseded_by = sqlite3_column_int64(stmt, 13);
    }
    return r;
}

// Append WHERE conditions for a filter. Text params are bound in order.
static std::string filter_clause(const RecordFilter& filter, std::vector<std::string>& params) {
    std::vector<std::string> conditions;
    if (!filter.include_inactive) {
        conditions.emplace_back("m.superseded_by IS NULL");
    }
    if (filter.category) {
        conditions.emplace_back("m.category = ?");
        params.push_back(category_to_string(*filter.category));
    }
    if (filter.project) {
        conditions.emplace_back("(m.project = ? OR m.project IS NULL)");
        params.push_back(*filter.project);
    }

    std::string clause;
    for (const auto& c : conditions) {
        clause += " AND " + c;
    }
    return clause;
}

static const char* order_clause(RecordOrder order) {
    switch (order) {
        case RecordOrder::Recency:    return " ORDER BY m.created_at DESC, m.id DESC";
        case RecordOrder::Importance: return " ORDER BY m.importance DESC, m.id ASC";
        case RecordOrder::Accessed:   return " ORDER BY m.access_count DESC, m.id ASC";
        case RecordOrder::Id:         break;
    }
    return " ORDER BY m.id ASC";
}

SqliteStore::SqliteStore(const std::string& path) : path_(path) {
    // Ensure parent directory exists
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw StoreError("SqliteStore: cannot create " + parent.string() + ": " + ec.message());
        }
    }

    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw StoreError("SqliteStore: failed to open database: " + err);
    }

    try {
        exec("PRAGMA journal_mode=WAL;");
        exec("PRAGMA synchronous=NORMAL;");
        exec("PRAGMA foreign_keys=ON;");
        // Allow FTS5 virtual table use inside triggers (required since SQLite 3.37)
        exec("PRAGMA trusted_schema=ON;");
        sqlite3_busy_timeout(db_, 5000);
        init_schema();
    } catch (const StoreError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteStore::~SqliteStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteStore::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errmsg(db_);
        sqlite3_free(err);
        throw StoreError("SqliteStore: " + msg);
    }
}

bool SqliteStore::has_column(const char* table, const char* column) {
    StmtGuard g;
    prepare(db_, std::string("PRAGMA table_info(") + table + ");", g);
    while (sqlite3_step(g.stmt) == SQLITE_ROW) {
        if (column_string(g.stmt, 1) == column) return true;
    }
    return false;
}

void SqliteStore::init_schema() {
    exec(
        "CREATE TABLE IF NOT EXISTS memories ("
        "  id             INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  category       TEXT NOT NULL,"
        "  content        TEXT NOT NULL,"
        "  context        TEXT,"
        "  project        TEXT,"
        "  confidence     REAL DEFAULT 0.8,"
        "  importance     REAL DEFAULT 0.5,"
        "  access_count   INTEGER DEFAULT 0,"
        "  last_accessed  TEXT,"
        "  created_at     TEXT NOT NULL,"
        "  updated_at     TEXT NOT NULL,"
        "  source_session TEXT,"
        "  superseded_by  INTEGER"
        ");");

    // Databases created before decay bookkeeping lack this column
    if (!has_column("memories", "decayed_at")) {
        exec("ALTER TABLE memories ADD COLUMN decayed_at TEXT;");
    }

    exec(
        "CREATE TABLE IF NOT EXISTS tags ("
        "  memory_id INTEGER NOT NULL,"
        "  tag       TEXT NOT NULL,"
        "  FOREIGN KEY (memory_id) REFERENCES memories(id) ON DELETE CASCADE,"
        "  PRIMARY KEY (memory_id, tag)"
        ");");

    exec(
        "CREATE TABLE IF NOT EXISTS relations ("
        "  from_id       INTEGER NOT NULL,"
        "  to_id         INTEGER NOT NULL,"
        "  relation_type TEXT NOT NULL,"
        "  FOREIGN KEY (from_id) REFERENCES memories(id),"
        "  FOREIGN KEY (to_id) REFERENCES memories(id),"
        "  PRIMARY KEY (from_id, to_id, relation_type)"
        ");");

    exec("CREATE INDEX IF NOT EXISTS idx_memories_category ON memories(category);");
    exec("CREATE INDEX IF NOT EXISTS idx_memories_project ON memories(project);");
    exec("CREATE INDEX IF NOT EXISTS idx_memories_importance ON memories(importance DESC);");
    exec("CREATE INDEX IF NOT EXISTS idx_memories_active ON memories(superseded_by)"
         " WHERE superseded_by IS NULL;");
    exec("CREATE INDEX IF NOT EXISTS idx_tags_tag ON tags(tag);");

    // FTS5 virtual table (external content referencing memories)
    exec(
        "CREATE VIRTUAL TABLE IF NOT EXISTS memories_fts "
        "USING fts5(content, context, category, content='memories', content_rowid='id');");

    // Triggers keeping FTS in sync. Indexed columns are immutable after
    // insert, so the update trigger only fires on direct repairs.
    exec(
        "CREATE TRIGGER IF NOT EXISTS memories_ai AFTER INSERT ON memories BEGIN"
        "  INSERT INTO memories_fts(rowid, content, context, category)"
        "  VALUES (new.id, new.content, new.context, new.category);"
        "END;");
    exec(
        "CREATE TRIGGER IF NOT EXISTS memories_ad AFTER DELETE ON memories BEGIN"
        "  INSERT INTO memories_fts(memories_fts, rowid, content, context, category)"
        "  VALUES ('delete', old.id, old.content, old.context, old.category);"
        "END;");
    exec(
        "CREATE TRIGGER IF NOT EXISTS memories_au AFTER UPDATE OF content, context, category"
        " ON memories BEGIN"
        "  INSERT INTO memories_fts(memories_fts, rowid, content, context, category)"
        "  VALUES ('delete', old.id, old.content, old.context, old.category);"
        "  INSERT INTO memories_fts(rowid, content, context, category)"
        "  VALUES (new.id, new.content, new.context, new.category);"
        "END;");
}

void SqliteStore::transaction(const std::function<void()>& fn) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (tx_depth_ > 0) {
        ++tx_depth_;
        try {
            fn();
        } catch (...) {
            --tx_depth_;
            throw;
        }
        --tx_depth_;
        return;
    }

    exec("BEGIN IMMEDIATE;");
    tx_depth_ = 1;
    try {
        fn();
        tx_depth_ = 0;
        exec("COMMIT;");
    } catch (...) {
        tx_depth_ = 0;
        if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK &&
            !sqlite3_get_autocommit(db_)) {
            std::cerr << "[store] Rollback failed: " << sqlite3_errmsg(db_) << "\n";
        }
        throw;
    }
}

int64_t SqliteStore::create(const NewRecord& record) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    std::string now = timestamp_now();
    std::string created = record.created_at.empty() ? now : record.created_at;
    std::string cat = category_to_string(record.category);
    int64_t id = 0;

    transaction([&]() {
        StmtGuard g;
        prepare(db_,
            "INSERT INTO memories"
            " (category, content, context, project, importance, confidence,"
            "  access_count, created_at, updated_at, source_session)"
            " VALUES (?, ?, ?, ?, ?, ?, 0, ?, ?, ?);", g);
        sqlite3_bind_text(g.stmt, 1, cat.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(g.stmt, 2, record.content.c_str(), -1, SQLITE_TRANSIENT);
        bind_optional_text(g.stmt, 3, record.context);
        bind_optional_text(g.stmt, 4, record.project);
        sqlite3_bind_double(g.stmt, 5, clamp_unit(record.importance));
        sqlite3_bind_double(g.stmt, 6, clamp_unit(record.confidence));
        sqlite3_bind_text(g.stmt, 7, created.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(g.stmt, 8, now.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(g.stmt, 9, record.source_session.c_str(), -1, SQLITE_TRANSIENT);
        step_done(db_, g);

        id = sqlite3_last_insert_rowid(db_);
        add_tags(id, record.tags);
    });

    return id;
}

std::optional<MemoryRecord> SqliteStore::load_record(int64_t id) {
    StmtGuard g;
    prepare(db_, std::string("SELECT ") + kRecordColumns + " FROM memories AS m WHERE m.id = ?;", g);
    sqlite3_bind_int64(g.stmt, 1, id);

    int rc = sqlite3_step(g.stmt);
    if (rc == SQLITE_ROW) return record_from_stmt(g.stmt);
    check_row_loop(db_, rc);
    return std::nullopt;
}

std::optional<MemoryRecord> SqliteStore::get(int64_t id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    auto record = load_record(id);
    if (record) record->tags = tags(id);
    return record;
}

bool SqliteStore::exists(int64_t id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    StmtGuard g;
    prepare(db_, "SELECT 1 FROM memories WHERE id = ?;", g);
    sqlite3_bind_int64(g.stmt, 1, id);
    int rc = sqlite3_step(g.stmt);
    if (rc == SQLITE_ROW) return true;
    check_row_loop(db_, rc);
    return false;
}

bool SqliteStore::update(int64_t id, const RecordMutator& mutator) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    bool changed = false;
    transaction([&]() {
        auto current = load_record(id);
        if (!current) return;

        MemoryRecord next = *current;
        if (!mutator(next)) return;

        std::string now = timestamp_now();
        StmtGuard g;
        prepare(db_,
            "UPDATE memories SET importance = ?, access_count = ?, last_accessed = ?,"
            " decayed_at = ?, superseded_by = ?, updated_at = ? WHERE id = ?;", g);
        sqlite3_bind_double(g.stmt, 1, clamp_unit(next.importance));
        sqlite3_bind_int64(g.stmt, 2, static_cast<int64_t>(next.access_count));
        bind_text_or_null(g.stmt, 3, next.last_accessed);
        bind_text_or_null(g.stmt, 4, next.decayed_at);
        if (next.superseded_by) {
            sqlite3_bind_int64(g.stmt, 5, *next.superseded_by);
        } else {
            sqlite3_bind_null(g.stmt, 5);
        }
        sqlite3_bind_text(g.stmt, 6, now.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(g.stmt, 7, id);
        step_done(db_, g);

        changed = sqlite3_changes(db_) > 0;
    });
    return changed;
}

void SqliteStore::populate_tags(std::vector<MemoryRecord>& records) {
    if (records.empty()) return;

    StmtGuard g;
    prepare(db_, "SELECT tag FROM tags WHERE memory_id = ? ORDER BY tag;", g);
    for (auto& r : records) {
        sqlite3_reset(g.stmt);
        sqlite3_bind_int64(g.stmt, 1, r.id);
        int rc = sqlite3_step(g.stmt);
        while (rc == SQLITE_ROW) {
            r.tags.push_back(column_string(g.stmt, 0));
            rc = sqlite3_step(g.stmt);
        }
        check_row_loop(db_, rc);
    }
}

std::vector<MemoryRecord> SqliteStore::query(const RecordFilter& filter, RecordOrder order,
                                             uint32_t limit) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    std::vector<std::string> params;
    std::string sql = std::string("SELECT ") + kRecordColumns +
                      " FROM memories AS m WHERE 1 = 1" + filter_clause(filter, params) +
                      order_clause(order);
    if (limit > 0) sql += " LIMIT ?";
    sql += ";";

    StmtGuard g;
    prepare(db_, sql, g);
    int col = 1;
    for (const auto& p : params) {
        sqlite3_bind_text(g.stmt, col++, p.c_str(), -1, SQLITE_TRANSIENT);
    }
    if (limit > 0) sqlite3_bind_int64(g.stmt, col, static_cast<int64_t>(limit));

    std::vector<MemoryRecord> results;
    int rc = sqlite3_step(g.stmt);
    while (rc == SQLITE_ROW) {
        results.push_back(record_from_stmt(g.stmt));
        rc = sqlite3_step(g.stmt);
    }
    check_row_loop(db_, rc);

    populate_tags(results);
    return results;
}

// Run a search query: bind text params + limit, collect (id, relevance) hits.
// negate_score flips the sign (bm25 returns lower-is-better negative values).
static std::vector<SearchHit> run_search_query(sqlite3* db, const std::string& sql,
                                               const std::vector<std::string>& text_params,
                                               uint32_t limit, bool negate_score) {
    StmtGuard g;
    prepare(db, sql, g);

    int col = 1;
    for (const auto& p : text_params) {
        sqlite3_bind_text(g.stmt, col++, p.c_str(), -1, SQLITE_TRANSIENT);
    }
    sqlite3_bind_int64(g.stmt, col, static_cast<int64_t>(limit));

    std::vector<SearchHit> hits;
    int rc = sqlite3_step(g.stmt);
    while (rc == SQLITE_ROW) {
        double s = sqlite3_column_double(g.stmt, 1);
        hits.push_back({sqlite3_column_int64(g.stmt, 0), negate_score ? -s : s});
        rc = sqlite3_step(g.stmt);
    }
    check_row_loop(db, rc);
    return hits;
}

std::vector<SearchHit> SqliteStore::search(const std::string& query, const RecordFilter& filter,
                                           uint32_t limit) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (query.empty() || limit == 0) return {};

    std::vector<SearchHit> hits;
    std::string fts_query = build_fts_query(query);
    if (!fts_query.empty()) {
        std::vector<std::string> params = {fts_query};
        std::string sql =
            "SELECT m.id, bm25(memories_fts) AS score"
            " FROM memories_fts"
            " JOIN memories AS m ON memories_fts.rowid = m.id"
            " WHERE memories_fts MATCH ?" + filter_clause(filter, params) +
            " ORDER BY bm25(memories_fts) LIMIT ?;";
        hits = run_search_query(db_, sql, params, limit, true);
    }

    if (hits.empty()) {
        std::string like_pat = build_like_pattern(query);
        std::vector<std::string> params = {like_pat, like_pat};
        std::string sql =
            "SELECT m.id, 0.0 FROM memories AS m"
            " WHERE (m.content LIKE ? ESCAPE '\\' OR m.context LIKE ? ESCAPE '\\')"
            + filter_clause(filter, params) +
            " ORDER BY m.created_at DESC, m.id DESC LIMIT ?;";
        hits = run_search_query(db_, sql, params, limit, false);
    }

    return hits;
}

void SqliteStore::touch(const std::vector<int64_t>& ids) {
    if (ids.empty()) return;
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    std::string now = timestamp_now();
    transaction([&]() {
        StmtGuard g;
        prepare(db_,
            "UPDATE memories SET access_count = access_count + 1,"
            " last_accessed = ?, updated_at = ? WHERE id = ?;", g);
        for (int64_t id : ids) {
            sqlite3_reset(g.stmt);
            sqlite3_bind_text(g.stmt, 1, now.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(g.stmt, 2, now.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int64(g.stmt, 3, id);
            step_done(db_, g);
        }
    });
}

std::vector<std::string> SqliteStore::tags(int64_t id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    StmtGuard g;
    prepare(db_, "SELECT tag FROM tags WHERE memory_id = ? ORDER BY tag;", g);
    sqlite3_bind_int64(g.stmt, 1, id);

    std::vector<std::string> result;
    int rc = sqlite3_step(g.stmt);
    while (rc == SQLITE_ROW) {
        result.push_back(column_string(g.stmt, 0));
        rc = sqlite3_step(g.stmt);
    }
    check_row_loop(db_, rc);
    return result;
}

void SqliteStore::add_tags(int64_t id, const std::vector<std::string>& tag_list) {
    if (tag_list.empty()) return;
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    transaction([&]() {
        StmtGuard g;
        prepare(db_, "INSERT OR IGNORE INTO tags (memory_id, tag) VALUES (?, ?);", g);
        for (const auto& raw : tag_list) {
            std::string tag = normalize_tag(raw);
            if (tag.empty()) continue;
            sqlite3_reset(g.stmt);
            sqlite3_bind_int64(g.stmt, 1, id);
            sqlite3_bind_text(g.stmt, 2, tag.c_str(), -1, SQLITE_TRANSIENT);
            step_done(db_, g);
        }
    });
}

bool SqliteStore::add_relation(const Relation& relation) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    std::string type = relation_type_to_string(relation.type);
    StmtGuard g;
    prepare(db_, "INSERT OR IGNORE INTO relations (from_id, to_id, relation_type)"
                 " VALUES (?, ?, ?);", g);
    sqlite3_bind_int64(g.stmt, 1, relation.from_id);
    sqlite3_bind_int64(g.stmt, 2, relation.to_id);
    sqlite3_bind_text(g.stmt, 3, type.c_str(), -1, SQLITE_TRANSIENT);
    step_done(db_, g);

    return sqlite3_changes(db_) > 0;
}

std::vector<Relation> SqliteStore::relations(int64_t id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    StmtGuard g;
    prepare(db_,
        "SELECT from_id, to_id, relation_type FROM relations"
        " WHERE from_id = ? OR to_id = ?"
        " ORDER BY from_id, to_id, relation_type;", g);
    sqlite3_bind_int64(g.stmt, 1, id);
    sqlite3_bind_int64(g.stmt, 2, id);

    std::vector<Relation> result;
    int rc = sqlite3_step(g.stmt);
    while (rc == SQLITE_ROW) {
        auto type = relation_type_from_string(column_string(g.stmt, 2));
        if (type) {
            result.push_back({sqlite3_column_int64(g.stmt, 0),
                              sqlite3_column_int64(g.stmt, 1), *type});
        }
        rc = sqlite3_step(g.stmt);
    }
    check_row_loop(db_, rc);
    return result;
}

StoreStats SqliteStore::stats() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    StoreStats s;
    {
        StmtGuard g;
        prepare(db_,
            "SELECT"
            "  SUM(CASE WHEN superseded_by IS NULL THEN 1 ELSE 0 END),"
            "  SUM(CASE WHEN superseded_by > 0 AND superseded_by <> id THEN 1 ELSE 0 END),"
            "  SUM(CASE WHEN superseded_by = id OR superseded_by < 0 THEN 1 ELSE 0 END)"
            " FROM memories;", g);
        int rc = sqlite3_step(g.stmt);
        if (rc != SQLITE_ROW) {
            check_row_loop(db_, rc);
        } else {
            s.total_active = static_cast<uint32_t>(sqlite3_column_int64(g.stmt, 0));
            s.total_superseded = static_cast<uint32_t>(sqlite3_column_int64(g.stmt, 1));
            s.total_retired = static_cast<uint32_t>(sqlite3_column_int64(g.stmt, 2));
        }
    }

    auto group_counts = [this](const char* sql, std::map<std::string, uint32_t>& out) {
        StmtGuard g;
        prepare(db_, sql, g);
        int rc = sqlite3_step(g.stmt);
        while (rc == SQLITE_ROW) {
            std::string key = sqlite3_column_type(g.stmt, 0) == SQLITE_NULL
                ? "global" : column_string(g.stmt, 0);
            out[key] = static_cast<uint32_t>(sqlite3_column_int64(g.stmt, 1));
            rc = sqlite3_step(g.stmt);
        }
        check_row_loop(db_, rc);
    };
    group_counts("SELECT category, COUNT(*) FROM memories"
                 " WHERE superseded_by IS NULL GROUP BY category;", s.by_category);
    group_counts("SELECT project, COUNT(*) FROM memories"
                 " WHERE superseded_by IS NULL GROUP BY project;", s.by_project);

    s.most_accessed = query(RecordFilter{}, RecordOrder::Accessed, 5);
    return s;
}

} // namespace mnemon
