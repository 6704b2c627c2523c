#pragma once

#include <string>
#include <map>
#include <vector>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// Raw settings from one source, keyed by config name (e.g. "vest-start")
using SettingsLayer = std::map<std::string, std::string>;

// What the command line asked for
struct CliOptions {
    bool show_help = false;
    bool show_version = false;
    std::optional<std::string> config_path;
    SettingsLayer overrides;
};

class Config {
public:
    // Load ~/.config/worth/config.yaml (or --config), then apply environment
    // and command-line overrides. Creates the default file if it is missing.
    static Result<Config> load(const CliOptions& cli);

    // Merge layers (command line beats environment beats file) and validate.
    static Result<Config> resolve(const SettingsLayer& file,
                                  const SettingsLayer& env,
                                  const SettingsLayer& cli);

    // Accessors
    const GrantParameters& grant() const { return grant_; }
    const std::string& api_key() const { return api_key_; }
    const MoneyFormat& money() const { return money_; }
    const fs::path& source_path() const { return source_path_; }

public:
    Config() = default;

private:
    GrantParameters grant_;
    std::string api_key_;
    MoneyFormat money_;
    fs::path source_path_;
};

// Every key understood in the config file, environment and command line
const std::vector<std::string>& config_keys();

// Environment variable consulted for a key: "vest-start" -> "VEST_START"
std::string env_name_for(const std::string& key);

// Parse argv (without the program name).
// Accepts --key value, --key=value, --config, --help and --version.
Result<CliOptions> parse_cli_args(const std::vector<std::string>& args);

// Read the recognized keys from a YAML file. An empty file yields no keys.
Result<SettingsLayer> read_config_file(const fs::path& path);

// Read the recognized keys from the environment.
SettingsLayer read_env_overrides();

// Get paths
fs::path get_config_dir();
fs::path get_default_config_path();

// Create ~/.config/worth (0700) and an empty config.yaml (0600) if missing
Result<void> ensure_default_config();
