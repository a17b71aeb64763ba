#include <catch2/catch_test_macros.hpp>
#include "memory.hpp"
#include "memory/relations.hpp"
#include "store_fixture.hpp"
#include <nlohmann/json.hpp>

using namespace mnemon;

static constexpr uint64_t kNow = 1704067200;

// ── conversions ──────────────────────────────────────────────

TEST_CASE("category_from_string: round-trips every category", "[memory]") {
    for (const auto& name : category_names()) {
        auto cat = category_from_string(name);
        REQUIRE(cat.has_value());
        REQUIRE(category_to_string(cat.value_or(Category::Facts)) == name);
    }
    REQUIRE_FALSE(category_from_string("knowledge").has_value());
    REQUIRE_FALSE(category_from_string("Facts").has_value());
}

TEST_CASE("relation_type_from_string: known and unknown", "[memory]") {
    REQUIRE(relation_type_from_string("refines").value_or(RelationType::Supports) ==
            RelationType::Refines);
    REQUIRE_FALSE(relation_type_from_string("").has_value());
}

TEST_CASE("clamp_unit: clamps into [0,1]", "[memory]") {
    REQUIRE(clamp_unit(-1.0) == 0.0);
    REQUIRE(clamp_unit(0.3) == 0.3);
    REQUIRE(clamp_unit(4.0) == 1.0);
}

TEST_CASE("normalize_content: case and surrounding whitespace", "[memory]") {
    REQUIRE(normalize_content("  Use PNPM \n") == "use pnpm");
}

// ── remember ─────────────────────────────────────────────────

TEST_CASE("remember: stores with defaults", "[memory]") {
    StoreFixture f;
    RememberRequest req;
    req.content = "The API lives under /v2";
    req.session_id = "sess";

    auto res = remember(f.store, req);
    REQUIRE(res.ok());
    REQUIRE(res.message == "Stored memory #" + std::to_string(res.id) +
                           " [facts] (importance=0.5, confidence=0.8)");

    auto r = f.fetch(res.id);
    REQUIRE(r.category == Category::Facts);
    REQUIRE(r.source_session == "sess");
    REQUIRE_FALSE(r.project.has_value());
}

TEST_CASE("remember: clamps declared values", "[memory]") {
    StoreFixture f;
    RememberRequest req;
    req.content = "Overconfident claim";
    req.importance = 3.0;
    req.confidence = -2.0;

    auto res = remember(f.store, req);
    REQUIRE(res.ok());
    auto r = f.fetch(res.id);
    REQUIRE(r.importance == 1.0);
    REQUIRE(r.confidence == 0.0);
}

TEST_CASE("remember: invalid category lists the valid ones", "[memory]") {
    StoreFixture f;
    RememberRequest req;
    req.content = "Something";
    req.category = "gossip";

    auto res = remember(f.store, req);
    REQUIRE(res.error == MemoryError::InvalidCategory);
    REQUIRE(res.message == "Invalid category 'gossip'. Use one of: corrections, decisions, "
                           "facts, preferences, procedures, project-knowledge, relationships");
    REQUIRE(f.store.stats().total_active == 0);
}

TEST_CASE("remember: empty content is rejected", "[memory]") {
    StoreFixture f;
    RememberRequest req;
    req.content = "  ";
    REQUIRE(remember(f.store, req).error == MemoryError::InvalidContent);
}

// ── recall ───────────────────────────────────────────────────

TEST_CASE("recall: returns matches and bumps access counts", "[memory]") {
    StoreFixture f;
    int64_t a = f.add("Postgres is the primary database");
    f.add("Redis is used for caching");

    RecallRequest req;
    req.query = "postgres";
    auto results = recall(f.store, req);
    REQUIRE(results.size() == 1);
    REQUIRE(results[0].id == a);
    REQUIRE(results[0].access_count == 0);
    REQUIRE(f.fetch(a).access_count == 1);
}

TEST_CASE("recall: hides superseded records unless asked", "[memory]") {
    StoreFixture f;
    int64_t old_id = f.add("Staging host is alpha");
    CorrectionRequest corr;
    corr.old_id = old_id;
    corr.new_content = "Staging host is beta";
    auto res = correct(f.store, corr);
    REQUIRE(res.ok());

    RecallRequest req;
    req.query = "staging host";
    auto results = recall(f.store, req);
    REQUIRE(results.size() == 1);
    REQUIRE(results[0].id == res.id);

    req.filter.include_inactive = true;
    REQUIRE(recall(f.store, req).size() == 2);
}

TEST_CASE("recall: category and project filters", "[memory]") {
    StoreFixture f;
    RememberRequest a;
    a.content = "Widget service uses gRPC";
    a.category = "project-knowledge";
    a.project = "widgets";
    RememberRequest b;
    b.content = "Gadget service uses gRPC";
    b.category = "project-knowledge";
    b.project = "gadgets";
    RememberRequest c;
    c.content = "gRPC deadlines default to 5s";
    REQUIRE(remember(f.store, a).ok());
    REQUIRE(remember(f.store, b).ok());
    REQUIRE(remember(f.store, c).ok());

    RecallRequest req;
    req.query = "grpc";
    req.filter.project = "widgets";
    REQUIRE(recall(f.store, req).size() == 2);

    req.filter.category = Category::ProjectKnowledge;
    auto results = recall(f.store, req);
    REQUIRE(results.size() == 1);
    REQUIRE(results[0].project.value_or("") == "widgets");
}

TEST_CASE("recall: empty query returns nothing", "[memory]") {
    StoreFixture f;
    f.add("anything at all");
    RecallRequest req;
    req.query = "   ";
    REQUIRE(recall(f.store, req).empty());
}

TEST_CASE("recall: wildcard-only query matches nothing and touches nothing", "[memory]") {
    StoreFixture f;
    int64_t a = f.add("Deploys happen on Tuesdays");
    int64_t b = f.add("Use pnpm instead of npm");

    for (const char* q : {"_", "%", "%_%"}) {
        RecallRequest req;
        req.query = q;
        REQUIRE(recall(f.store, req).empty());
    }
    REQUIRE(f.fetch(a).access_count == 0);
    REQUIRE(f.fetch(b).access_count == 0);
}

// ── list_memories ────────────────────────────────────────────

TEST_CASE("list_memories: score ordering", "[memory]") {
    StoreFixture f;
    int64_t low = f.add("low value", Category::Facts, 0.2);
    int64_t high = f.add("high value", Category::Facts, 0.9);

    auto records = list_memories(f.store, RecordFilter{}, ListSort::Score, 10, kNow);
    REQUIRE(records.size() == 2);
    REQUIRE(records[0].id == high);
    REQUIRE(records[1].id == low);
    REQUIRE(records[0].score > records[1].score);
}

TEST_CASE("list_memories: never lists inactive records", "[memory]") {
    StoreFixture f;
    int64_t a = f.add("keep");
    int64_t b = f.add("drop");
    REQUIRE(forget(f.store, b).ok());

    RecordFilter filter;
    filter.include_inactive = true;
    auto records = list_memories(f.store, filter, ListSort::Recency, 10, kNow);
    REQUIRE(records.size() == 1);
    REQUIRE(records[0].id == a);
}

TEST_CASE("list_memories: limit and access bookkeeping", "[memory]") {
    StoreFixture f;
    for (int i = 0; i < 5; i++) f.add("item " + std::to_string(i));

    auto records = list_memories(f.store, RecordFilter{}, ListSort::Importance, 3, kNow);
    REQUIRE(records.size() == 3);
    for (const auto& r : records) {
        REQUIRE(f.fetch(r.id).access_count == 1);
    }
}

TEST_CASE("list_sort_from_string: known keys", "[memory]") {
    REQUIRE(list_sort_from_string("accessed").value_or(ListSort::Score) == ListSort::Accessed);
    REQUIRE_FALSE(list_sort_from_string("random").has_value());
}

// ── snapshot_export ──────────────────────────────────────────

TEST_CASE("snapshot_export: includes every state and outgoing relations", "[memory]") {
    StoreFixture f;
    int64_t old_id = f.add("v1");
    CorrectionRequest corr;
    corr.old_id = old_id;
    corr.new_content = "v2";
    auto res = correct(f.store, corr);
    REQUIRE(res.ok());

    auto j = nlohmann::json::parse(snapshot_export(f.store));
    REQUIRE(j.is_array());
    REQUIRE(j.size() == 2);
    REQUIRE(j[0]["id"] == old_id);
    REQUIRE(j[0]["superseded_by"] == res.id);
    REQUIRE(j[0]["relations"].empty());
    REQUIRE(j[1]["relations"].size() == 1);
    REQUIRE(j[1]["relations"][0]["relation"] == "supersedes");
    REQUIRE(j[1]["superseded_by"].is_null());
}
