#pragma once
#include "../tool.hpp"
#include "../memory.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>

namespace mnemon {

// Common preamble for memory tool execute(): check the store and parse JSON args.
// Returns a ToolResult error on failure, or std::nullopt on success (args populated).
inline std::optional<ToolResult> parse_memory_tool_args(
    MemoryStore* store, const std::string& args_json, nlohmann::json& out) {
    if (!store) return ToolResult{false, "Memory store is not available"};
    try {
        out = nlohmann::json::parse(args_json.empty() ? std::string("{}") : args_json);
    } catch (const nlohmann::json::exception& e) {
        return ToolResult{false, std::string("Failed to parse arguments: ") + e.what()};
    }
    if (!out.is_object()) return ToolResult{false, "Arguments must be a JSON object"};
    return std::nullopt;
}

// Check that a required string field exists. Returns error ToolResult if missing.
inline std::optional<ToolResult> require_string(const nlohmann::json& args, const char* field) {
    if (!args.contains(field) || !args[field].is_string()) {
        return ToolResult{false, std::string("Missing required parameter: ") + field};
    }
    return std::nullopt;
}

// Check that a required integer field exists. Returns error ToolResult if missing.
inline std::optional<ToolResult> require_integer(const nlohmann::json& args, const char* field) {
    if (!args.contains(field) || !args[field].is_number_integer()) {
        return ToolResult{false, std::string("Missing required parameter: ") + field};
    }
    return std::nullopt;
}

inline std::optional<std::string> optional_string(const nlohmann::json& args, const char* field) {
    if (args.contains(field) && args[field].is_string()) return args[field].get<std::string>();
    return std::nullopt;
}

inline double number_or(const nlohmann::json& args, const char* field, double fallback) {
    if (args.contains(field) && args[field].is_number()) return args[field].get<double>();
    return fallback;
}

// Values above the uint32 range saturate rather than wrap.
inline uint32_t limit_or(const nlohmann::json& args, const char* field, uint32_t fallback) {
    if (args.contains(field) && args[field].is_number_unsigned()) {
        uint64_t v = args[field].get<uint64_t>();
        return static_cast<uint32_t>(
            std::min<uint64_t>(v, std::numeric_limits<uint32_t>::max()));
    }
    return fallback;
}

inline ToolResult to_tool_result(const OpResult& result) {
    return ToolResult{result.ok(), result.message};
}

// Run a store-backed tool body; StoreError becomes a store_unavailable result.
template <typename Fn>
ToolResult with_store(Fn&& fn) {
    try {
        return fn();
    } catch (const StoreError& e) {
        return ToolResult{false, error_to_string(MemoryError::StoreUnavailable) + ": " + e.what()};
    }
}

} // namespace mnemon
