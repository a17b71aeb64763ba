#include <catch2/catch_test_macros.hpp>
#include "config.hpp"
#include "plugin.hpp"
#include "tools/remember.hpp"
#include "tools/recall.hpp"
#include "tools/correct.hpp"
#include "tools/forget.hpp"
#include "tools/list_memories.hpp"
#include "tools/memory_stats.hpp"
#include "tools/relate.hpp"
#include "tools/memory_tool_util.hpp"
#include "store_fixture.hpp"
#include <nlohmann/json.hpp>

using namespace mnemon;

struct ToolTestFixture : StoreFixture {
    Config config;
    RememberTool remember_tool;
    RecallTool recall_tool;
    CorrectTool correct_tool;
    ForgetTool forget_tool;
    ListMemoriesTool list_tool;
    MemoryStatsTool stats_tool;
    RelateTool relate_tool;

    ToolTestFixture() {
        config.session_id = "tool-session";
        for (MemoryAwareTool* t : std::initializer_list<MemoryAwareTool*>{
                 &remember_tool, &recall_tool, &correct_tool, &forget_tool,
                 &list_tool, &stats_tool, &relate_tool}) {
            t->set_store(&store);
            t->set_config(&config);
        }
    }

    int64_t remember_id(const std::string& args) {
        auto r = remember_tool.execute(args);
        REQUIRE(r.success);
        auto hash = r.output.find('#');
        return std::stoll(r.output.substr(hash + 1));
    }
};

// ── registry ─────────────────────────────────────────────────

TEST_CASE("create_memory_tools: all tools registered and wired", "[memory_tools]") {
    StoreFixture f;
    Config cfg;
    auto tools = create_memory_tools(&f.store, &cfg);

    auto names = PluginRegistry::instance().tool_names();
    REQUIRE(names == std::vector<std::string>{"correct", "forget", "list_memories",
                                              "memory_stats", "recall", "relate", "remember"});
    REQUIRE(tools.size() == names.size());

}

TEST_CASE("create_memory_tool: by name, wired to the store", "[memory_tools]") {
    StoreFixture f;
    Config cfg;
    auto stats = create_memory_tool("memory_stats", &f.store, &cfg);
    REQUIRE(stats != nullptr);
    REQUIRE(stats->tool_name() == "memory_stats");
    REQUIRE(stats->execute("{}").success);

    REQUIRE(create_memory_tool("shell", &f.store, &cfg) == nullptr);
}

TEST_CASE("Memory tools: specs carry valid JSON schemas", "[memory_tools]") {
    auto tools = create_memory_tools(nullptr, nullptr);
    for (const auto& t : tools) {
        auto spec = t->spec();
        REQUIRE_FALSE(spec.description.empty());
        auto schema = nlohmann::json::parse(spec.parameters_json);
        REQUIRE(schema["type"] == "object");
    }
}

TEST_CASE("Memory tools: no store reports an error", "[memory_tools]") {
    RememberTool tool;
    auto r = tool.execute(R"({"content":"x"})");
    REQUIRE_FALSE(r.success);
    REQUIRE(r.output == "Memory store is not available");
}

// ── remember ─────────────────────────────────────────────────

TEST_CASE("RememberTool: stores a memory", "[memory_tools]") {
    ToolTestFixture f;
    auto r = f.remember_tool.execute(
        R"({"content":"Prefers Rust for CLIs","category":"preferences","importance":0.8,"tags":["Rust"," cli "]})");
    REQUIRE(r.success);
    REQUIRE(r.output.find("[preferences] (importance=0.8, confidence=0.8)") != std::string::npos);

    auto records = f.store.query(RecordFilter{}, RecordOrder::Id, 0);
    REQUIRE(records.size() == 1);
    REQUIRE(records[0].tags == std::vector<std::string>{"cli", "rust"});
    REQUIRE(records[0].source_session == "tool-session");
}

TEST_CASE("RememberTool: missing content", "[memory_tools]") {
    ToolTestFixture f;
    auto r = f.remember_tool.execute(R"({"category":"facts"})");
    REQUIRE_FALSE(r.success);
    REQUIRE(r.output == "Missing required parameter: content");
}

TEST_CASE("RememberTool: invalid category", "[memory_tools]") {
    ToolTestFixture f;
    auto r = f.remember_tool.execute(R"({"content":"hello world","category":"misc"})");
    REQUIRE_FALSE(r.success);
    REQUIRE(r.output.rfind("Invalid category 'misc'", 0) == 0);
}

TEST_CASE("RememberTool: malformed JSON", "[memory_tools]") {
    ToolTestFixture f;
    auto r = f.remember_tool.execute("{not json");
    REQUIRE_FALSE(r.success);
    REQUIRE(r.output.rfind("Failed to parse arguments", 0) == 0);
}

// ── recall ───────────────────────────────────────────────────

TEST_CASE("RecallTool: returns JSON results", "[memory_tools]") {
    ToolTestFixture f;
    int64_t id = f.remember_id(R"({"content":"Kafka topics use snake_case"})");

    auto r = f.recall_tool.execute(R"({"query":"kafka"})");
    REQUIRE(r.success);
    auto j = nlohmann::json::parse(r.output);
    REQUIRE(j.size() == 1);
    REQUIRE(j[0]["id"] == id);
    REQUIRE(j[0]["category"] == "facts");
    REQUIRE(j[0]["project"].is_null());
    REQUIRE(f.fetch(id).access_count == 1);
}

TEST_CASE("RecallTool: no matches", "[memory_tools]") {
    ToolTestFixture f;
    auto r = f.recall_tool.execute(R"({"query":"nothing here"})");
    REQUIRE(r.success);
    REQUIRE(r.output == "No memories found matching that query.");
}

TEST_CASE("RecallTool: include_superseded marks inactive records", "[memory_tools]") {
    ToolTestFixture f;
    int64_t id = f.remember_id(R"({"content":"Office is in Berlin"})");
    REQUIRE(f.forget_tool.execute(R"({"memory_id":)" + std::to_string(id) + "}").success);

    auto hidden = f.recall_tool.execute(R"({"query":"berlin"})");
    REQUIRE(hidden.output == "No memories found matching that query.");

    auto r = f.recall_tool.execute(R"({"query":"berlin","include_superseded":true})");
    auto j = nlohmann::json::parse(r.output);
    REQUIRE(j.size() == 1);
    REQUIRE(j[0]["superseded"] == true);
}

TEST_CASE("RecallTool: oversized limit saturates instead of wrapping", "[memory_tools]") {
    ToolTestFixture f;
    f.remember_id(R"({"content":"Kafka retention is seven days"})");

    auto r = f.recall_tool.execute(R"({"query":"kafka","limit":4294967296})");
    REQUIRE(r.success);
    REQUIRE(nlohmann::json::parse(r.output).size() == 1);
}

TEST_CASE("limit_or: clamps to the uint32 range", "[memory_tools]") {
    auto args = nlohmann::json::parse(R"({"big":4294967296,"neg":-1,"ok":7})");
    REQUIRE(limit_or(args, "big", 5) == 4294967295u);
    REQUIRE(limit_or(args, "neg", 5) == 5);
    REQUIRE(limit_or(args, "ok", 5) == 7);
    REQUIRE(limit_or(args, "missing", 5) == 5);
}

// ── correct / forget / relate ────────────────────────────────

TEST_CASE("CorrectTool: supersedes the old memory", "[memory_tools]") {
    ToolTestFixture f;
    int64_t id = f.remember_id(R"({"content":"CI runs on Jenkins"})");

    auto r = f.correct_tool.execute(R"({"old_memory_id":)" + std::to_string(id) +
                                    R"(,"new_content":"CI runs on GitHub Actions","reason":"migrated"})");
    REQUIRE(r.success);
    REQUIRE(r.output.find("superseded by #") != std::string::npos);
    REQUIRE(f.fetch(id).superseded_by.has_value());
}

TEST_CASE("CorrectTool: unknown id", "[memory_tools]") {
    ToolTestFixture f;
    auto r = f.correct_tool.execute(R"({"old_memory_id":99,"new_content":"whatever"})");
    REQUIRE_FALSE(r.success);
    REQUIRE(r.output == "Memory #99 not found.");
}

TEST_CASE("ForgetTool: forget then forget again", "[memory_tools]") {
    ToolTestFixture f;
    int64_t id = f.remember_id(R"({"content":"Temporary password hint"})");
    std::string args = R"({"memory_id":)" + std::to_string(id) + "}";

    auto first = f.forget_tool.execute(args);
    REQUIRE(first.success);
    REQUIRE(first.output == "Forgotten memory #" + std::to_string(id) + ": Temporary password hint");

    auto second = f.forget_tool.execute(args);
    REQUIRE_FALSE(second.success);
    REQUIRE(second.output.find("not found or already forgotten") != std::string::npos);
}

TEST_CASE("ForgetTool: id must be an integer", "[memory_tools]") {
    ToolTestFixture f;
    auto r = f.forget_tool.execute(R"({"memory_id":"3"})");
    REQUIRE_FALSE(r.success);
    REQUIRE(r.output == "Missing required parameter: memory_id");
}

TEST_CASE("RelateTool: links and validates", "[memory_tools]") {
    ToolTestFixture f;
    int64_t a = f.remember_id(R"({"content":"Service A calls service B"})");
    int64_t b = f.remember_id(R"({"content":"Service B owns billing"})");
    std::string ids = R"("from_id":)" + std::to_string(a) + R"(,"to_id":)" + std::to_string(b);

    auto ok = f.relate_tool.execute("{" + ids + R"(,"relation":"refines"})");
    REQUIRE(ok.success);
    REQUIRE(ok.output == "Linked #" + std::to_string(a) + " --refines--> #" + std::to_string(b));

    auto bad = f.relate_tool.execute("{" + ids + R"(,"relation":"loves"})");
    REQUIRE_FALSE(bad.success);
    REQUIRE(bad.output.rfind("Invalid relation 'loves'", 0) == 0);
}

// ── list_memories / memory_stats ─────────────────────────────

TEST_CASE("ListMemoriesTool: lists active memories", "[memory_tools]") {
    ToolTestFixture f;
    f.remember_id(R"({"content":"Low priority note","importance":0.1})");
    int64_t top = f.remember_id(R"({"content":"High priority note","importance":0.9})");

    auto r = f.list_tool.execute(R"({"sort":"importance","limit":1})");
    REQUIRE(r.success);
    auto j = nlohmann::json::parse(r.output);
    REQUIRE(j.size() == 1);
    REQUIRE(j[0]["id"] == top);
}

TEST_CASE("ListMemoriesTool: empty store", "[memory_tools]") {
    ToolTestFixture f;
    auto r = f.list_tool.execute("{}");
    REQUIRE(r.success);
    REQUIRE(r.output == "No memories found.");
}

TEST_CASE("MemoryStatsTool: reports totals", "[memory_tools]") {
    ToolTestFixture f;
    f.remember_id(R"({"content":"Global fact one"})");
    int64_t gone = f.remember_id(R"({"content":"Project fact","project":"shop","category":"decisions"})");
    f.forget_tool.execute(R"({"memory_id":)" + std::to_string(gone) + "}");

    auto r = f.stats_tool.execute("{}");
    REQUIRE(r.success);
    auto j = nlohmann::json::parse(r.output);
    REQUIRE(j["total_active"] == 1);
    REQUIRE(j["total_retired"] == 1);
    REQUIRE(j["by_category"]["facts"] == 1);
    REQUIRE(j["by_project"]["global"] == 1);
    REQUIRE(j["backend"] == "sqlite");
}
