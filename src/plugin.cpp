#include "plugin.hpp"
#include <stdexcept>
#include <algorithm>

namespace mnemon {

PluginRegistry& PluginRegistry::instance() {
    static PluginRegistry registry;
    return registry;
}

void PluginRegistry::register_tool(const std::string& name, ToolFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    tools_[name] = std::move(factory);
}

std::vector<std::unique_ptr<Tool>> PluginRegistry::create_all_tools() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::unique_ptr<Tool>> result;
    result.reserve(tools_.size());
    for (const auto& [name, factory] : tools_) {
        result.push_back(factory());
    }
    std::sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
        return a->tool_name() < b->tool_name();
    });
    return result;
}

std::unique_ptr<Tool> PluginRegistry::create_tool(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        throw std::invalid_argument("Unknown tool: " + name);
    }
    return it->second();
}

std::vector<std::string> PluginRegistry::tool_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& [name, _] : tools_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool PluginRegistry::has_tool(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_.count(name) > 0;
}

} // namespace mnemon
