#include "memory_stats.hpp"
#include "memory_tool_util.hpp"
#include "../plugin.hpp"

static mnemon::ToolRegistrar reg_memory_stats("memory_stats",
    []() { return std::make_unique<mnemon::MemoryStatsTool>(); });

namespace mnemon {

ToolResult MemoryStatsTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_memory_tool_args(store_, args_json, args)) return *err;

    return with_store([&]() {
        StoreStats stats = store_->stats();

        nlohmann::json out;
        out["total_active"] = stats.total_active;
        out["total_superseded"] = stats.total_superseded;
        out["total_retired"] = stats.total_retired;
        out["by_category"] = stats.by_category;
        out["by_project"] = stats.by_project;
        out["most_accessed"] = nlohmann::json::array();
        for (const auto& r : stats.most_accessed) {
            out["most_accessed"].push_back({
                {"id", r.id},
                {"content", r.content},
                {"access_count", r.access_count}
            });
        }
        out["backend"] = store_->backend_name();
        return ToolResult{true, out.dump(2)};
    });
}

std::string MemoryStatsTool::description() const {
    return "Show totals and breakdowns of the memory store";
}

std::string MemoryStatsTool::parameters_json() const {
    return R"({"type":"object","properties":{}})";
}

} // namespace mnemon
