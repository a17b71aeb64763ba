#pragma once
#include "../memory.hpp"
#include "../config.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mnemon {

// Project name for a working directory: the nearest ancestor holding a
// .claude/ directory or a CLAUDE.md file, else the directory's own name.
// nullopt when cwd is the home directory (or empty).
std::optional<std::string> detect_project(const std::string& cwd);

// Strip a surrounding markdown code fence, if any.
std::string strip_code_fence(const std::string& text);

// Parse extractor output into validated candidates: at most max_items,
// content at least min_content_length chars, unknown categories -> facts,
// importance/confidence clamped, tags normalized and capped. Throws
// nlohmann::json::exception on malformed JSON.
std::vector<NewRecord> parse_candidates(const std::string& raw_text,
                                        const ExtractionConfig& config);

// Store the candidates found in raw_text. Best-effort: any failure is logged
// and the batch is dropped. Returns the number of records stored.
uint32_t ingest_candidates(MemoryStore& store, const std::string& raw_text,
                           const std::optional<std::string>& project,
                           const std::string& session_id,
                           const ExtractionConfig& config);

} // namespace mnemon
