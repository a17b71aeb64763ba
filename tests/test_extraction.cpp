#include <catch2/catch_test_macros.hpp>
#include "memory/extraction.hpp"
#include "store_fixture.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

using namespace mnemon;

// ── strip_code_fence ─────────────────────────────────────────

TEST_CASE("strip_code_fence: removes json fence", "[extraction]") {
    REQUIRE(strip_code_fence("```json\n[1, 2]\n```") == "[1, 2]");
    REQUIRE(strip_code_fence("```\n[]\n```\n") == "[]");
}

TEST_CASE("strip_code_fence: plain text only trimmed", "[extraction]") {
    REQUIRE(strip_code_fence("  [] \n") == "[]");
}

// ── parse_candidates ─────────────────────────────────────────

TEST_CASE("parse_candidates: validates and normalizes items", "[extraction]") {
    std::string raw = R"([
        {"content": "  User prefers dark mode in every editor ", "category": "preferences",
         "importance": 1.4, "confidence": 0.95, "tags": [" UI ", "Editor", 3, ""]},
        {"content": "too short", "category": "facts"},
        {"content": "Builds run through make ci locally", "category": "rumours"},
        {"category": "facts"}
    ])";

    auto items = parse_candidates(raw, ExtractionConfig{});
    REQUIRE(items.size() == 2);

    REQUIRE(items[0].content == "User prefers dark mode in every editor");
    REQUIRE(items[0].category == Category::Preferences);
    REQUIRE(items[0].importance == 1.0);
    REQUIRE(items[0].confidence == 0.95);
    REQUIRE(items[0].tags == std::vector<std::string>{"ui", "editor"});
    REQUIRE(items[0].context.value_or("") == "Auto-extracted");

    REQUIRE(items[1].category == Category::Facts);
    REQUIRE(items[1].importance == 0.5);
    REQUIRE(items[1].confidence == 0.8);
}

TEST_CASE("parse_candidates: caps batch size and tags", "[extraction]") {
    nlohmann::json arr = nlohmann::json::array();
    for (int i = 0; i < 8; i++) {
        arr.push_back({
            {"content", "Candidate memory number " + std::to_string(i)},
            {"tags", {"a1", "b2", "c3", "d4", "e5", "f6", "g7"}}
        });
    }

    auto items = parse_candidates(arr.dump(), ExtractionConfig{});
    REQUIRE(items.size() == 5);
    REQUIRE(items[0].tags.size() == 5);
    REQUIRE(items[4].content == "Candidate memory number 4");
}

TEST_CASE("parse_candidates: non-array payload yields nothing", "[extraction]") {
    REQUIRE(parse_candidates(R"({"content": "not a list"})", ExtractionConfig{}).empty());
}

TEST_CASE("parse_candidates: malformed JSON throws", "[extraction]") {
    REQUIRE_THROWS_AS(parse_candidates("[{oops", ExtractionConfig{}), nlohmann::json::exception);
}

// ── ingest_candidates ────────────────────────────────────────

TEST_CASE("ingest_candidates: stores with project and session", "[extraction]") {
    StoreFixture f;
    std::string raw = "```json\n"
        R"([{"content": "Release branches are cut every Monday", "category": "procedures"}])"
        "\n```";

    uint32_t stored = ingest_candidates(f.store, raw, std::string("shop"), "sess-9",
                                        ExtractionConfig{});
    REQUIRE(stored == 1);

    auto records = f.store.query(RecordFilter{}, RecordOrder::Id, 0);
    REQUIRE(records.size() == 1);
    REQUIRE(records[0].project.value_or("") == "shop");
    REQUIRE(records[0].source_session == "sess-9");
    REQUIRE(records[0].context.value_or("") == "Auto-extracted");
    REQUIRE(records[0].category == Category::Procedures);
}

TEST_CASE("ingest_candidates: garbage is dropped silently", "[extraction]") {
    StoreFixture f;
    REQUIRE(ingest_candidates(f.store, "I found nothing worth keeping.", std::nullopt, "",
                              ExtractionConfig{}) == 0);
    REQUIRE(ingest_candidates(f.store, "[]", std::nullopt, "", ExtractionConfig{}) == 0);
    REQUIRE(f.store.stats().total_active == 0);
}

// ── detect_project ───────────────────────────────────────────

struct ProjectTree {
    std::string root = "/tmp/mnemon_test_proj_" + std::to_string(getpid());

    ProjectTree() {
        std::filesystem::create_directories(root + "/webshop/.claude");
        std::filesystem::create_directories(root + "/webshop/src/api");
        std::filesystem::create_directories(root + "/notes/2024");
        std::filesystem::create_directories(root + "/toolbox/lib");
        std::ofstream(root + "/toolbox/CLAUDE.md") << "# toolbox\n";
    }

    ~ProjectTree() {
        std::filesystem::remove_all(root);
    }
};

TEST_CASE("detect_project: nearest ancestor with .claude", "[extraction]") {
    ProjectTree t;
    REQUIRE(detect_project(t.root + "/webshop/src/api").value_or("") == "webshop");
    REQUIRE(detect_project(t.root + "/webshop").value_or("") == "webshop");
}

TEST_CASE("detect_project: CLAUDE.md marks a project root", "[extraction]") {
    ProjectTree t;
    REQUIRE(detect_project(t.root + "/toolbox/lib").value_or("") == "toolbox");
}

TEST_CASE("detect_project: falls back to the directory name", "[extraction]") {
    ProjectTree t;
    REQUIRE(detect_project(t.root + "/notes/2024").value_or("") == "2024");
}

TEST_CASE("detect_project: home directory has no project", "[extraction]") {
    const char* home = std::getenv("HOME");
    if (!home || std::string(home).empty() || std::string(home) == "/") return;
    REQUIRE_FALSE(detect_project(home).has_value());
    REQUIRE_FALSE(detect_project("").has_value());
}
