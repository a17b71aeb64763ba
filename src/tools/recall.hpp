#pragma once
#include "../tool.hpp"

namespace mnemon {

class RecallTool : public MemoryAwareTool {
public:
    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "recall"; }
    std::string description() const override;
    std::string parameters_json() const override;
};

} // namespace mnemon
