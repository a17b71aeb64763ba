#include "relate.hpp"
#include "memory_tool_util.hpp"
#include "../plugin.hpp"
#include "../memory/relations.hpp"

static mnemon::ToolRegistrar reg_relate("relate",
    []() { return std::make_unique<mnemon::RelateTool>(); });

namespace mnemon {

ToolResult RelateTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_memory_tool_args(store_, args_json, args)) return *err;
    if (auto err = require_integer(args, "from_id")) return *err;
    if (auto err = require_integer(args, "to_id")) return *err;
    if (auto err = require_string(args, "relation")) return *err;

    int64_t from = args["from_id"].get<int64_t>();
    int64_t to = args["to_id"].get<int64_t>();
    std::string relation = args["relation"].get<std::string>();

    return with_store([&]() { return to_tool_result(relate(*store_, from, to, relation)); });
}

std::string RelateTool::description() const {
    return "Create a typed link between two memories";
}

std::string RelateTool::parameters_json() const {
    return R"json({"type":"object","properties":{"from_id":{"type":"integer","description":"Source memory ID"},"to_id":{"type":"integer","description":"Target memory ID"},"relation":{"type":"string","enum":["contradicts","refines","supersedes","supports"],"description":"Relation type"}},"required":["from_id","to_id","relation"]})json";
}

} // namespace mnemon
