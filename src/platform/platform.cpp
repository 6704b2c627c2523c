#include "platform.hpp"
#include <cstdlib>

#ifndef _WIN32
#  include <sys/stat.h>
#endif

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
    if (!home) home = std::getenv("HOME");
#else
    const char* home = std::getenv("HOME");
#endif
    if (!home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

std::optional<std::string> get_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value || !*value) return std::nullopt;
    return std::string(value);
}

bool set_mode(const fs::path& path, unsigned mode) {
#ifdef _WIN32
    (void)path;
    (void)mode;
    return true;
#else
    return chmod(path.c_str(), static_cast<mode_t>(mode)) == 0;
#endif
}

} // namespace platform
