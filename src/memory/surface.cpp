#include "surface.hpp"
#include "extraction.hpp"
#include "scoring.hpp"
#include "sqlite_store.hpp"
#include "../util.hpp"
#include <filesystem>
#include <iostream>
#include <sstream>

namespace mnemon {

static const char* const kHeader =
    "# Mnemon Memory System\n"
    "# Auto-generated at session start. Do not edit manually.\n"
    "# Store: remember | Search: recall | Fix: correct, forget\n"
    "\n";

struct SectionSpec {
    Category category;
    const char* title;
};

// Render order; the project section goes after the first three.
static const SectionSpec kLeadingSections[] = {
    {Category::Preferences, "Preferences"},
    {Category::Corrections, "Corrections (Do Not Repeat)"},
    {Category::Facts, "Key Facts"},
};

static const SectionSpec kTrailingSections[] = {
    {Category::Decisions, "Past Decisions"},
    {Category::Procedures, "Known Procedures"},
    {Category::Relationships, "Relationships"},
};

static std::vector<MemoryRecord> ranked_active(MemoryStore& store, uint64_t now) {
    auto records = store.query(RecordFilter{}, RecordOrder::Id, 0);
    rank_records(records, now);
    return records;
}

static std::map<Category, std::vector<MemoryRecord>> partition(
    const std::vector<MemoryRecord>& ranked, const SurfaceConfig& config) {
    std::map<Category, std::vector<MemoryRecord>> out;
    for (const auto& r : ranked) {
        auto& bucket = out[r.category];
        if (bucket.size() < config.cap_for(category_to_string(r.category))) {
            bucket.push_back(r);
        }
    }
    return out;
}

std::map<Category, std::vector<MemoryRecord>> ranked_by_category(
    MemoryStore& store, const SurfaceConfig& config, uint64_t now) {
    return partition(ranked_active(store, now), config);
}

SurfaceView build_surface_view(MemoryStore& store, const SurfaceConfig& config,
                               const std::optional<std::string>& project, uint64_t now) {
    SurfaceView view;
    auto ranked = ranked_active(store, now);
    view.total_active = static_cast<uint32_t>(ranked.size());
    view.by_category = partition(ranked, config);
    view.project = project;

    if (project) {
        for (const auto& r : ranked) {
            if (view.project_items.size() >= config.project_limit) break;
            if (r.category == Category::Preferences || r.category == Category::Corrections) continue;
            if (r.project && *r.project == *project) view.project_items.push_back(r);
        }
    }
    return view;
}

static void append_section(std::ostringstream& out, const SurfaceView& view,
                           const SectionSpec& section) {
    auto it = view.by_category.find(section.category);
    if (it == view.by_category.end() || it->second.empty()) return;
    out << "## " << section.title << "\n";
    for (const auto& r : it->second) out << "- " << r.content << "\n";
    out << "\n";
}

std::string render_summary(const SurfaceView& view, const SurfaceConfig& config) {
    std::ostringstream out;
    out << kHeader;

    for (const auto& s : kLeadingSections) append_section(out, view, s);

    if (view.project && !view.project_items.empty()) {
        out << "## Current Project: " << *view.project << "\n";
        for (const auto& r : view.project_items) {
            out << "- [" << category_to_string(r.category) << "] " << r.content << "\n";
        }
        out << "\n";
    }

    for (const auto& s : kTrailingSections) append_section(out, view, s);

    out << "---\n*Mnemon: " << view.total_active
        << " memories stored. Use `recall` to search the full store.*\n";

    // Keep at most max_lines lines
    std::string text = out.str();
    std::string result;
    uint32_t lines = 0;
    size_t pos = 0;
    while (pos < text.size() && lines < config.max_lines) {
        size_t nl = text.find('\n', pos);
        if (nl == std::string::npos) nl = text.size();
        result.append(text, pos, nl - pos);
        result += '\n';
        lines++;
        pos = nl + 1;
    }
    return result;
}

std::string surface_output_path(const std::string& cwd) {
    return (std::filesystem::path(cwd) / ".claude" / "rules" / "mnemon-memories.md").string();
}

bool write_surface(const Config& config, const std::string& cwd,
                   const std::string& output_path) {
    std::string path = config.db_path();
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return false;

    try {
        SqliteStore store(path);
        SurfaceView view = build_surface_view(store, config.surface, detect_project(cwd),
                                              epoch_seconds());
        if (view.total_active == 0) return false;

        if (!atomic_write_file(output_path, render_summary(view, config.surface))) {
            std::cerr << "[surface] Failed to write " << output_path << "\n";
            return false;
        }
        return true;
    } catch (const StoreError& e) {
        std::cerr << "[surface] Store unavailable, skipping: " << e.what() << "\n";
        return false;
    }
}

} // namespace mnemon
