#pragma once
#include "tool.hpp"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <unordered_map>
#include <mutex>

namespace mnemon {

using ToolFactory = std::function<std::unique_ptr<Tool>()>;

// Central registry for self-registering tools.
// All methods are thread-safe.
class PluginRegistry {
public:
    static PluginRegistry& instance();

    void register_tool(const std::string& name, ToolFactory factory);

    std::vector<std::unique_ptr<Tool>> create_all_tools() const;
    std::unique_ptr<Tool> create_tool(const std::string& name) const;

    std::vector<std::string> tool_names() const;
    bool has_tool(const std::string& name) const;

private:
    PluginRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ToolFactory> tools_;
};

// ── Self-registrar helper (used at file scope in each tool .cpp) ──

struct ToolRegistrar {
    ToolRegistrar(const std::string& name, ToolFactory factory) {
        PluginRegistry::instance().register_tool(name, std::move(factory));
    }
};

} // namespace mnemon
