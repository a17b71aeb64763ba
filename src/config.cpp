#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <nlohmann/json.hpp>

namespace mnemon {

uint32_t SurfaceConfig::cap_for(const std::string& category) const {
    auto it = category_caps.find(category);
    if (it != category_caps.end()) return it->second;
    return default_cap;
}

nlohmann::json Config::defaults_json() {
    return {
        {"memory", {
            {"path", ""},
            {"recall_limit", 10},
            {"list_limit", 20}
        }},
        {"consolidation", {
            {"decay_age_days", 30},
            {"decay_factor", 0.9},
            {"decay_floor", 0.1},
            {"retire_age_days", 90},
            {"retire_threshold", 0.1}
        }},
        {"extraction", {
            {"max_items", 5},
            {"min_content_length", 10},
            {"max_tags", 5}
        }},
        {"surface", {
            {"max_lines", 120},
            {"project_limit", 8},
            {"category_caps", {
                {"preferences", 8},
                {"corrections", 5},
                {"facts", 6},
                {"decisions", 5},
                {"procedures", 5},
                {"relationships", 4},
                {"project-knowledge", 8}
            }}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void read_uint(const nlohmann::json& obj, const char* field, uint32_t& out,
                      uint64_t min = 0) {
    if (obj.contains(field) && obj[field].is_number_unsigned()) {
        uint64_t v = obj[field].get<uint64_t>();
        if (v >= min && v <= std::numeric_limits<uint32_t>::max())
            out = static_cast<uint32_t>(v);
    }
}

static void read_unit(const nlohmann::json& obj, const char* field, double& out) {
    if (obj.contains(field) && obj[field].is_number()) {
        double v = obj[field].get<double>();
        if (v >= 0.0 && v <= 1.0) out = v;
    }
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    if (j.contains("memory") && j["memory"].is_object()) {
        auto& m = j["memory"];
        if (m.contains("path") && m["path"].is_string())
            cfg.memory.path = m["path"].get<std::string>();
        read_uint(m, "recall_limit", cfg.memory.recall_limit);
        read_uint(m, "list_limit", cfg.memory.list_limit);
    }

    if (j.contains("consolidation") && j["consolidation"].is_object()) {
        auto& c = j["consolidation"];
        // 0 would re-decay every idle record on every sweep
        read_uint(c, "decay_age_days", cfg.consolidation.decay_age_days, 1);
        read_unit(c, "decay_factor", cfg.consolidation.decay_factor);
        read_unit(c, "decay_floor", cfg.consolidation.decay_floor);
        read_uint(c, "retire_age_days", cfg.consolidation.retire_age_days);
        read_unit(c, "retire_threshold", cfg.consolidation.retire_threshold);
    }

    if (j.contains("extraction") && j["extraction"].is_object()) {
        auto& e = j["extraction"];
        read_uint(e, "max_items", cfg.extraction.max_items);
        read_uint(e, "min_content_length", cfg.extraction.min_content_length);
        read_uint(e, "max_tags", cfg.extraction.max_tags);
    }

    if (j.contains("surface") && j["surface"].is_object()) {
        auto& s = j["surface"];
        read_uint(s, "max_lines", cfg.surface.max_lines);
        read_uint(s, "project_limit", cfg.surface.project_limit);
        if (s.contains("category_caps") && s["category_caps"].is_object()) {
            for (auto& [name, cap] : s["category_caps"].items()) {
                if (cap.is_number_unsigned())
                    cfg.surface.category_caps[name] = cap.get<uint32_t>();
            }
        }
    }

    return cfg;
}

Config Config::load() {
    std::string config_path = expand_home("~/.mnemon/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n")) {
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
                }
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed config " << config_path
                      << ": " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    if (const char* v = std::getenv("MNEMON_DB_PATH"))
        cfg.memory.path = v;
    if (const char* v = std::getenv("SESSION_ID"))
        cfg.session_id = v;

    return cfg;
}

std::string Config::db_path() const {
    if (!memory.path.empty()) return expand_home(memory.path);
    return expand_home("~/.mnemon/mnemon.db");
}

} // namespace mnemon
