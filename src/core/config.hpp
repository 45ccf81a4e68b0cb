#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace conduit::core::config {

// Default .env search roots: the working directory and its two parents.
std::vector<std::filesystem::path> default_search_paths();

// Load variables from the first .env found under the search roots.
// Idempotent; variables already present in the environment are never overridden.
void load_dotenv(const std::vector<std::filesystem::path>& search_paths = default_search_paths());

// Parse a single .env file into the environment. Returns the number of
// variables set.
int apply_dotenv_file(const std::filesystem::path& env_path);

// Get environment variable, empty string if missing.
std::string get_env(const std::string& key);

// Get environment variable with default fallback.
std::string get_env_or(const std::string& key, const std::string& fallback);

} // namespace conduit::core::config
