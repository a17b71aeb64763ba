#include "list_memories.hpp"
#include "memory_tool_util.hpp"
#include "../config.hpp"
#include "../plugin.hpp"
#include "../util.hpp"
#include "../memory/record_json.hpp"

static mnemon::ToolRegistrar reg_list_memories("list_memories",
    []() { return std::make_unique<mnemon::ListMemoriesTool>(); });

namespace mnemon {

ToolResult ListMemoriesTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_memory_tool_args(store_, args_json, args)) return *err;

    RecordFilter filter;
    if (auto cat = optional_string(args, "category")) {
        filter.category = category_from_string(*cat);
        if (!filter.category) {
            return ToolResult{false, "Invalid category '" + *cat + "'"};
        }
    }
    filter.project = optional_string(args, "project");

    uint32_t limit = limit_or(args, "limit", config_ ? config_->memory.list_limit : 20);

    // Unknown sort keys fall back to score ordering
    ListSort sort = ListSort::Score;
    if (auto s = optional_string(args, "sort")) {
        sort = list_sort_from_string(*s).value_or(ListSort::Score);
    }

    return with_store([&]() {
        auto records = list_memories(*store_, filter, sort, limit, epoch_seconds());
        if (records.empty()) return ToolResult{true, "No memories found."};

        nlohmann::json results = nlohmann::json::array();
        for (const auto& r : records) results.push_back(record_to_json(r));
        return ToolResult{true, results.dump(2)};
    });
}

std::string ListMemoriesTool::description() const {
    return "List active memories sorted by score, recency, importance, or access count";
}

std::string ListMemoriesTool::parameters_json() const {
    return R"json({"type":"object","properties":{"category":{"type":"string","description":"Optional category filter"},"project":{"type":"string","description":"Optional project filter (global memories are always included)"},"limit":{"type":"integer","description":"Maximum number of results (default: 20)"},"sort":{"type":"string","enum":["score","recency","importance","accessed"],"description":"Sort order (default: score)"}}})json";
}

} // namespace mnemon
