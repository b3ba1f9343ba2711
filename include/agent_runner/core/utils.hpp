#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace agent_runner::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::string read_text(const fs::path& path);
// Writes to a sibling temp file, then renames over `path`
void write_text_atomic(const fs::path& path, const std::string& text);

// String utilities
std::string to_lower(const std::string& s);
std::string trim(const std::string& s);
bool starts_with(const std::string& str, const std::string& prefix);
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// True for names safe to use as a single path component
bool is_safe_file_stem(const std::string& name);

} // namespace agent_runner::core
