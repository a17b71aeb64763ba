#include "recall.hpp"
#include "memory_tool_util.hpp"
#include "../config.hpp"
#include "../plugin.hpp"
#include "../memory/record_json.hpp"

static mnemon::ToolRegistrar reg_recall("recall",
    []() { return std::make_unique<mnemon::RecallTool>(); });

namespace mnemon {

ToolResult RecallTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_memory_tool_args(store_, args_json, args)) return *err;
    if (auto err = require_string(args, "query")) return *err;

    RecallRequest req;
    req.query = args["query"].get<std::string>();
    req.limit = limit_or(args, "limit", config_ ? config_->memory.recall_limit : 10);

    if (auto cat = optional_string(args, "category")) {
        req.filter.category = category_from_string(*cat);
        if (!req.filter.category) {
            return ToolResult{false, "Invalid category '" + *cat + "'"};
        }
    }
    req.filter.project = optional_string(args, "project");
    if (args.contains("include_superseded") && args["include_superseded"].is_boolean()) {
        req.filter.include_inactive = args["include_superseded"].get<bool>();
    }

    return with_store([&]() {
        auto records = recall(*store_, req);
        if (records.empty()) {
            return ToolResult{true, "No memories found matching that query."};
        }

        nlohmann::json results = nlohmann::json::array();
        for (const auto& r : records) {
            nlohmann::json item = record_to_json(r);
            if (r.superseded_by) item["superseded"] = true;
            results.push_back(std::move(item));
        }
        return ToolResult{true, results.dump(2)};
    });
}

std::string RecallTool::description() const {
    return "Search stored memories by keyword, most relevant first";
}

std::string RecallTool::parameters_json() const {
    return R"json({"type":"object","properties":{"query":{"type":"string","description":"Search query"},"category":{"type":"string","description":"Optional category filter"},"project":{"type":"string","description":"Optional project filter (global memories are always included)"},"limit":{"type":"integer","description":"Maximum number of results (default: 10)"},"include_superseded":{"type":"boolean","description":"Also return superseded and retired memories"}},"required":["query"]})json";
}

} // namespace mnemon
