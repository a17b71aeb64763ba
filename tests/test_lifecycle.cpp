#include <catch2/catch_test_macros.hpp>
#include "memory/lifecycle.hpp"
#include "store_fixture.hpp"

using namespace mnemon;

TEST_CASE("state_of: derived from superseded_by", "[lifecycle]") {
    MemoryRecord r;
    r.id = 7;
    REQUIRE(state_of(r) == Lifecycle::Active);

    r.superseded_by = 9;
    REQUIRE(state_of(r) == Lifecycle::Superseded);

    r.superseded_by = 7;
    REQUIRE(state_of(r) == Lifecycle::Retired);

    r.superseded_by = RETIRED_SENTINEL;
    REQUIRE(state_of(r) == Lifecycle::Retired);
}

TEST_CASE("lifecycle_to_string: names", "[lifecycle]") {
    REQUIRE(lifecycle_to_string(Lifecycle::Active) == "active");
    REQUIRE(lifecycle_to_string(Lifecycle::Superseded) == "superseded");
    REQUIRE(lifecycle_to_string(Lifecycle::Retired) == "retired");
}

// ── retire ───────────────────────────────────────────────────

TEST_CASE("retire: forgotten records point at themselves", "[lifecycle]") {
    StoreFixture f;
    int64_t id = f.add("to be forgotten");

    auto res = retire(f.store, id, RetireReason::Forgotten);
    REQUIRE(res.ok());
    REQUIRE(f.fetch(id).superseded_by.value_or(0) == id);
    REQUIRE(state_of(f.fetch(id)) == Lifecycle::Retired);
}

TEST_CASE("retire: decayed records carry the sentinel", "[lifecycle]") {
    StoreFixture f;
    int64_t id = f.add("to be decayed");

    REQUIRE(retire(f.store, id, RetireReason::Decayed).ok());
    REQUIRE(f.fetch(id).superseded_by.value_or(0) == RETIRED_SENTINEL);
}

TEST_CASE("retire: unknown id is NotFound", "[lifecycle]") {
    StoreFixture f;
    auto res = retire(f.store, 123, RetireReason::Forgotten);
    REQUIRE(res.error == MemoryError::NotFound);
}

TEST_CASE("retire: terminal states cannot be retired again", "[lifecycle]") {
    StoreFixture f;
    int64_t id = f.add("retired once");
    REQUIRE(retire(f.store, id, RetireReason::Decayed).ok());

    auto res = retire(f.store, id, RetireReason::Forgotten);
    REQUIRE(res.error == MemoryError::IllegalTransition);
    REQUIRE(f.fetch(id).superseded_by.value_or(0) == RETIRED_SENTINEL);
}

// ── supersede ────────────────────────────────────────────────

TEST_CASE("supersede: active record points at its replacement", "[lifecycle]") {
    StoreFixture f;
    int64_t old_id = f.add("old statement");
    int64_t new_id = f.add("new statement");

    REQUIRE(supersede(f.store, old_id, new_id).ok());
    REQUIRE(f.fetch(old_id).superseded_by.value_or(0) == new_id);
    REQUIRE(state_of(f.fetch(new_id)) == Lifecycle::Active);
}

TEST_CASE("supersede: self reference is rejected", "[lifecycle]") {
    StoreFixture f;
    int64_t id = f.add("self");
    REQUIRE(supersede(f.store, id, id).error == MemoryError::IllegalTransition);
    REQUIRE(state_of(f.fetch(id)) == Lifecycle::Active);
}

TEST_CASE("supersede: missing replacement is NotFound", "[lifecycle]") {
    StoreFixture f;
    int64_t id = f.add("orphan");
    REQUIRE(supersede(f.store, id, 999).error == MemoryError::NotFound);
    REQUIRE(supersede(f.store, 999, id).error == MemoryError::NotFound);
    REQUIRE(state_of(f.fetch(id)) == Lifecycle::Active);
}

TEST_CASE("supersede: no path back to active", "[lifecycle]") {
    StoreFixture f;
    int64_t a = f.add("a");
    int64_t b = f.add("b");
    int64_t c = f.add("c");

    REQUIRE(supersede(f.store, a, b).ok());
    REQUIRE(supersede(f.store, a, c).error == MemoryError::IllegalTransition);
    REQUIRE(retire(f.store, a, RetireReason::Forgotten).error == MemoryError::IllegalTransition);
    REQUIRE(f.fetch(a).superseded_by.value_or(0) == b);
}
