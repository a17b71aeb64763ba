#include "remember.hpp"
#include "memory_tool_util.hpp"
#include "../config.hpp"
#include "../plugin.hpp"

static mnemon::ToolRegistrar reg_remember("remember",
    []() { return std::make_unique<mnemon::RememberTool>(); });

namespace mnemon {

ToolResult RememberTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_memory_tool_args(store_, args_json, args)) return *err;
    if (auto err = require_string(args, "content")) return *err;

    RememberRequest req;
    req.content = args["content"].get<std::string>();
    if (auto cat = optional_string(args, "category")) req.category = *cat;
    req.project = optional_string(args, "project");
    req.context = optional_string(args, "context");
    req.importance = number_or(args, "importance", 0.5);
    req.confidence = number_or(args, "confidence", 0.8);
    if (args.contains("tags") && args["tags"].is_array()) {
        for (const auto& tag : args["tags"]) {
            if (tag.is_string()) req.tags.push_back(tag.get<std::string>());
        }
    }
    if (config_) req.session_id = config_->session_id;

    return with_store([&]() { return to_tool_result(remember(*store_, req)); });
}

std::string RememberTool::description() const {
    return "Store a new memory (a concise, reusable statement)";
}

std::string RememberTool::parameters_json() const {
    return R"json({"type":"object","properties":{"content":{"type":"string","description":"The knowledge to store (1-2 sentences)"},"category":{"type":"string","enum":["corrections","decisions","facts","preferences","procedures","project-knowledge","relationships"],"description":"Memory category (default: facts)"},"project":{"type":"string","description":"Project name, omit for global memories"},"importance":{"type":"number","description":"0.0-1.0 how critical this is (default: 0.5)"},"confidence":{"type":"number","description":"0.0-1.0 how certain this is (default: 0.8)"},"tags":{"type":"array","items":{"type":"string"},"description":"Optional keyword tags"},"context":{"type":"string","description":"Where or when this was learned"}},"required":["content"]})json";
}

} // namespace mnemon
