#pragma once
#include "../tool.hpp"

namespace mnemon {

class MemoryStatsTool : public MemoryAwareTool {
public:
    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "memory_stats"; }
    std::string description() const override;
    std::string parameters_json() const override;
};

} // namespace mnemon
