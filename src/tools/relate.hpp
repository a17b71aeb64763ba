#pragma once
#include "../tool.hpp"

namespace mnemon {

class RelateTool : public MemoryAwareTool {
public:
    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "relate"; }
    std::string description() const override;
    std::string parameters_json() const override;
};

} // namespace mnemon
