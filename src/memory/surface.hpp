#pragma once
#include "../memory.hpp"
#include "../config.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mnemon {

// Active records grouped for the session-start summary.
struct SurfaceView {
    // Best-scored first, each list capped per category
    std::map<Category, std::vector<MemoryRecord>> by_category;
    // Records of the current project outside preferences/corrections
    std::vector<MemoryRecord> project_items;
    std::optional<std::string> project;
    uint32_t total_active = 0;
};

// Score every active record at `now`, sort (ties by lowest id) and partition
// per category with the configured caps.
std::map<Category, std::vector<MemoryRecord>> ranked_by_category(
    MemoryStore& store, const SurfaceConfig& config, uint64_t now);

SurfaceView build_surface_view(MemoryStore& store, const SurfaceConfig& config,
                               const std::optional<std::string>& project, uint64_t now);

// Markdown summary, truncated to config.max_lines.
std::string render_summary(const SurfaceView& view, const SurfaceConfig& config);

// <cwd>/.claude/rules/mnemon-memories.md
std::string surface_output_path(const std::string& cwd);

// Regenerate the summary file for cwd. Skips (returns false) when the store
// does not exist, cannot be opened, or holds no active records.
bool write_surface(const Config& config, const std::string& cwd,
                   const std::string& output_path);

} // namespace mnemon
