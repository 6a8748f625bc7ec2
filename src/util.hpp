#pragma once
#include <string>
#include <cstdint>

namespace modelgate {

// Unix epoch seconds
uint64_t epoch_seconds();

// Trim whitespace
std::string trim(const std::string& s);

// Lower-case ASCII copy
std::string to_lower(const std::string& s);

// Collapse runs of whitespace to a single space, trim, lower-case.
// Used to normalize payload text before fingerprinting and embedding.
std::string normalize_text(const std::string& s);

// Generate a simple unique ID (hex)
std::string generate_id();

// Estimate token count from text (~4 chars per token, at least 1 for non-empty)
uint32_t estimate_tokens(const std::string& text);

// Hex-encoded SHA-256 digest
std::string sha256_hex(const std::string& data);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename so readers never see a partial file.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace modelgate
