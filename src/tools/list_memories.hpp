#pragma once
#include "../tool.hpp"

namespace mnemon {

class ListMemoriesTool : public MemoryAwareTool {
public:
    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "list_memories"; }
    std::string description() const override;
    std::string parameters_json() const override;
};

} // namespace mnemon
