#pragma once
#include <string>
#include <cstdint>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace mnemon {

struct MemoryConfig {
    std::string path;               // empty = ~/.mnemon/mnemon.db
    uint32_t recall_limit = 10;
    uint32_t list_limit = 20;
};

struct ConsolidationConfig {
    uint32_t decay_age_days = 30;   // also the minimum gap between two decays
    double decay_factor = 0.9;
    double decay_floor = 0.1;       // importance at or below this is not decayed
    uint32_t retire_age_days = 90;
    double retire_threshold = 0.1;
};

struct ExtractionConfig {
    uint32_t max_items = 5;
    uint32_t min_content_length = 10;
    uint32_t max_tags = 5;
};

struct SurfaceConfig {
    uint32_t max_lines = 120;
    uint32_t project_limit = 8;
    // Per-category caps keyed by category name. Missing categories use default_cap.
    std::unordered_map<std::string, uint32_t> category_caps = {
        {"preferences", 8},
        {"corrections", 5},
        {"facts", 6},
        {"decisions", 5},
        {"procedures", 5},
        {"relationships", 4},
        {"project-knowledge", 8}
    };
    uint32_t default_cap = 5;

    uint32_t cap_for(const std::string& category) const;
};

struct Config {
    std::string session_id;

    MemoryConfig memory;
    ConsolidationConfig consolidation;
    ExtractionConfig extraction;
    SurfaceConfig surface;

    // Load from ~/.mnemon/config.json + env vars
    static Config load();

    // Parse a config JSON object on top of the built-in defaults
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Resolved database path (config value or default location)
    std::string db_path() const;
};

} // namespace mnemon
