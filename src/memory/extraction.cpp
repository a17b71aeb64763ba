#include "extraction.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace mnemon {

static const char* const kExtractedContext = "Auto-extracted";

static fs::path resolve(const std::string& path) {
    std::error_code ec;
    fs::path p = fs::weakly_canonical(fs::path(path), ec);
    if (ec) return fs::path(path).lexically_normal();
    return p;
}

static fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) return {};
    return resolve(home);
}

static bool is_project_root(const fs::path& dir) {
    std::error_code ec;
    return fs::is_directory(dir / ".claude", ec) || fs::exists(dir / "CLAUDE.md", ec);
}

std::optional<std::string> detect_project(const std::string& cwd) {
    if (cwd.empty()) return std::nullopt;

    fs::path start = resolve(cwd);
    fs::path home = home_dir();

    fs::path current = start;
    while (current != current.parent_path() && current != home) {
        if (is_project_root(current)) return current.filename().string();
        current = current.parent_path();
    }

    if (start == home || start.filename().empty()) return std::nullopt;
    return start.filename().string();
}

std::string strip_code_fence(const std::string& text) {
    std::string t = trim(text);
    if (t.compare(0, 3, "```") != 0) return t;

    auto first_nl = t.find('\n');
    if (first_nl == std::string::npos) return "";
    std::string body = t.substr(first_nl + 1);
    auto close = body.rfind("```");
    if (close != std::string::npos) body = body.substr(0, close);
    return trim(body);
}

static double unit_field(const nlohmann::json& item, const char* key, double fallback) {
    if (!item.contains(key) || !item[key].is_number()) return fallback;
    return clamp_unit(item[key].get<double>());
}

std::vector<NewRecord> parse_candidates(const std::string& raw_text,
                                        const ExtractionConfig& config) {
    std::vector<NewRecord> out;
    auto items = nlohmann::json::parse(strip_code_fence(raw_text));
    if (!items.is_array()) return out;

    uint32_t seen = 0;
    for (const auto& item : items) {
        if (seen++ >= config.max_items) break;
        if (!item.is_object()) continue;

        std::string content;
        if (item.contains("content") && item["content"].is_string()) {
            content = trim(item["content"].get<std::string>());
        }
        if (content.size() < config.min_content_length) continue;

        NewRecord rec;
        rec.content = content;
        rec.category = Category::Facts;
        if (item.contains("category") && item["category"].is_string()) {
            if (auto cat = category_from_string(item["category"].get<std::string>())) {
                rec.category = *cat;
            }
        }
        rec.importance = unit_field(item, "importance", 0.5);
        rec.confidence = unit_field(item, "confidence", 0.8);
        rec.context = std::string(kExtractedContext);

        if (item.contains("tags") && item["tags"].is_array()) {
            uint32_t taken = 0;
            for (const auto& tag : item["tags"]) {
                if (taken++ >= config.max_tags) break;
                if (!tag.is_string()) continue;
                std::string t = normalize_tag(tag.get<std::string>());
                if (!t.empty()) rec.tags.push_back(t);
            }
        }
        out.push_back(std::move(rec));
    }
    return out;
}

uint32_t ingest_candidates(MemoryStore& store, const std::string& raw_text,
                           const std::optional<std::string>& project,
                           const std::string& session_id,
                           const ExtractionConfig& config) {
    uint32_t stored = 0;
    try {
        auto candidates = parse_candidates(raw_text, config);
        if (candidates.empty()) return 0;

        store.transaction([&]() {
            for (auto& rec : candidates) {
                rec.project = project;
                rec.source_session = session_id;
                store.create(rec);
                stored++;
            }
        });
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[extract] Ignoring malformed candidate batch: " << e.what() << "\n";
        return 0;
    } catch (const StoreError& e) {
        std::cerr << "[extract] Failed to store candidates: " << e.what() << "\n";
        return 0;
    }
    return stored;
}

} // namespace mnemon
