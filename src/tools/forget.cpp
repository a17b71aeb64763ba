#include "forget.hpp"
#include "memory_tool_util.hpp"
#include "../plugin.hpp"
#include "../memory/relations.hpp"

static mnemon::ToolRegistrar reg_forget("forget",
    []() { return std::make_unique<mnemon::ForgetTool>(); });

namespace mnemon {

ToolResult ForgetTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_memory_tool_args(store_, args_json, args)) return *err;
    if (auto err = require_integer(args, "memory_id")) return *err;

    int64_t id = args["memory_id"].get<int64_t>();
    return with_store([&]() { return to_tool_result(forget(*store_, id)); });
}

std::string ForgetTool::description() const {
    return "Retire a memory so it is no longer recalled or surfaced";
}

std::string ForgetTool::parameters_json() const {
    return R"({"type":"object","properties":{"memory_id":{"type":"integer","description":"ID of the memory to forget"}},"required":["memory_id"]})";
}

} // namespace mnemon
