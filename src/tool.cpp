#include "tool.hpp"
#include "plugin.hpp"

namespace mnemon {

static void wire(Tool& tool, MemoryStore* store, const Config* config) {
    if (auto* aware = dynamic_cast<MemoryAwareTool*>(&tool)) {
        aware->set_store(store);
        aware->set_config(config);
    }
}

std::vector<std::unique_ptr<Tool>> create_memory_tools(MemoryStore* store,
                                                       const Config* config) {
    auto tools = PluginRegistry::instance().create_all_tools();
    for (auto& tool : tools) {
        wire(*tool, store, config);
    }
    return tools;
}

std::unique_ptr<Tool> create_memory_tool(const std::string& name, MemoryStore* store,
                                         const Config* config) {
    auto& registry = PluginRegistry::instance();
    if (!registry.has_tool(name)) return nullptr;
    auto tool = registry.create_tool(name);
    wire(*tool, store, config);
    return tool;
}

} // namespace mnemon
