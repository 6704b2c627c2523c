#pragma once

#include <string>
#include <optional>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Returns the system temporary directory (/tmp on Unix, GetTempPath on Windows).
std::filesystem::path temp_dir();

// Value of an environment variable, or nullopt if unset or empty.
std::optional<std::string> get_env(const std::string& name);

// chmod on Unix; a no-op on Windows. Returns false if the mode could not be set.
bool set_mode(const std::filesystem::path& path, unsigned mode);

} // namespace platform
