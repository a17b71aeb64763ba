#include "correct.hpp"
#include "memory_tool_util.hpp"
#include "../config.hpp"
#include "../plugin.hpp"
#include "../memory/relations.hpp"

static mnemon::ToolRegistrar reg_correct("correct",
    []() { return std::make_unique<mnemon::CorrectTool>(); });

namespace mnemon {

ToolResult CorrectTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_memory_tool_args(store_, args_json, args)) return *err;
    if (auto err = require_integer(args, "old_memory_id")) return *err;
    if (auto err = require_string(args, "new_content")) return *err;

    CorrectionRequest req;
    req.old_id = args["old_memory_id"].get<int64_t>();
    req.new_content = args["new_content"].get<std::string>();
    req.reason = optional_string(args, "reason");
    if (config_) req.session_id = config_->session_id;

    return with_store([&]() { return to_tool_result(correct(*store_, req)); });
}

std::string CorrectTool::description() const {
    return "Replace an outdated or wrong memory with corrected content";
}

std::string CorrectTool::parameters_json() const {
    return R"json({"type":"object","properties":{"old_memory_id":{"type":"integer","description":"ID of the memory to supersede"},"new_content":{"type":"string","description":"The corrected knowledge"},"reason":{"type":"string","description":"Why the old memory was wrong"}},"required":["old_memory_id","new_content"]})json";
}

} // namespace mnemon
