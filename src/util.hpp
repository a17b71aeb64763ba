#pragma once
#include <string>
#include <optional>
#include <cstdint>

namespace mnemon {

// ISO 8601 timestamp (UTC, second precision)
std::string timestamp_now();

// Format epoch seconds as ISO 8601 UTC ("2026-01-31T08:15:00Z")
std::string format_timestamp(uint64_t epoch);

// Parse an ISO 8601 timestamp into epoch seconds.
// Accepts "YYYY-MM-DDTHH:MM:SS" with optional fractional seconds and an
// optional "Z" or "+HH:MM"/"-HH:MM" offset. A missing offset means UTC.
std::optional<uint64_t> parse_timestamp(const std::string& s);

// Unix epoch seconds
uint64_t epoch_seconds();

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lower-case
std::string to_lower(const std::string& s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename. Creates parent directories.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace mnemon
