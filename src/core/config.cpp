#include "config.hpp"
#include "constants.hpp"
#include "log.hpp"
#include "time_utils.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <fstream>

namespace fs = std::filesystem;

const std::vector<std::string>& config_keys() {
    static const std::vector<std::string> keys = {
        "ticker",
        "apikey",
        "strike-price",
        "shares",
        "shares-sold",
        "vest-start",
        "vest-end",
        "currency-symbol",
        "currency-precision",
    };
    return keys;
}

static bool is_config_key(const std::string& key) {
    const auto& keys = config_keys();
    return std::find(keys.begin(), keys.end(), key) != keys.end();
}

std::string env_name_for(const std::string& key) {
    std::string name = key;
    for (auto& c : name) {
        c = (c == '-') ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return name;
}

fs::path get_config_dir() {
    return platform::home_dir() / ".config" / "worth";
}

fs::path get_default_config_path() {
    return get_config_dir() / "config.yaml";
}

Result<void> ensure_default_config() {
    fs::path dir = get_config_dir();
    fs::path path = get_default_config_path();

    try {
        if (!fs::exists(dir)) {
            fs::create_directories(dir);
            if (!platform::set_mode(dir, 0700)) {
                return Result<void>::Err("Failed to set permissions on " + dir.string());
            }
        }

        // Don't overwrite existing config
        if (fs::exists(path)) {
            return Result<void>::Ok();
        }

        std::ofstream out(path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + path.string());
        }
        out.close();
        if (!platform::set_mode(path, 0600)) {
            return Result<void>::Err("Failed to set permissions on " + path.string());
        }
        worth_log("config: created empty " + path.string());
        return Result<void>::Ok();
    } catch (const fs::filesystem_error& e) {
        return Result<void>::Err(std::string("Failed to create config directory: ") + e.what());
    }
}

Result<SettingsLayer> read_config_file(const fs::path& path) {
    try {
        YAML::Node root = YAML::LoadFile(path.string());
        SettingsLayer layer;

        // Empty file
        if (root.IsNull()) {
            return Result<SettingsLayer>::Ok(layer);
        }
        if (!root.IsMap()) {
            return Result<SettingsLayer>::Err("Config file " + path.string() + " must be a mapping of key: value");
        }

        const YAML::Node& doc = root;
        for (const auto& key : config_keys()) {
            // "shares sold" was the historical spelling of shares-sold
            YAML::Node node = (key == "shares-sold" && !doc[key]) ? doc["shares sold"] : doc[key];
            if (!node || node.IsNull()) continue;
            if (!node.IsScalar()) {
                return Result<SettingsLayer>::Err(fmt::format("Config key '{}' must be a single value", key));
            }
            layer[key] = node.as<std::string>();
        }
        return Result<SettingsLayer>::Ok(layer);
    } catch (const YAML::Exception& e) {
        return Result<SettingsLayer>::Err(std::string("Failed to parse config file: ") + e.what());
    }
}

SettingsLayer read_env_overrides() {
    SettingsLayer layer;
    for (const auto& key : config_keys()) {
        auto value = platform::get_env(env_name_for(key));
        if (value) layer[key] = *value;
    }
    return layer;
}

Result<CliOptions> parse_cli_args(const std::vector<std::string>& args) {
    CliOptions opts;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];

        if (arg == "--help" || arg == "-h") {
            opts.show_help = true;
            continue;
        }
        if (arg == "--version") {
            opts.show_version = true;
            continue;
        }
        if (arg.rfind("--", 0) != 0 || arg.size() == 2) {
            return Result<CliOptions>::Err("Unexpected argument: " + arg);
        }

        std::string name = arg.substr(2);
        std::optional<std::string> value;
        auto eq = name.find('=');
        if (eq != std::string::npos) {
            value = name.substr(eq + 1);
            name = name.substr(0, eq);
        }

        if (name != "config" && !is_config_key(name)) {
            return Result<CliOptions>::Err("Unknown flag: --" + name);
        }

        if (!value) {
            if (i + 1 >= args.size()) {
                return Result<CliOptions>::Err("Flag --" + name + " needs a value");
            }
            value = args[++i];
        }

        if (name == "config") {
            opts.config_path = *value;
        } else {
            opts.overrides[name] = *value;
        }
    }

    return Result<CliOptions>::Ok(opts);
}

// ── Resolution ──────────────────────────────────────────────

static std::optional<std::string> pick(const std::string& key,
                                       const SettingsLayer& file,
                                       const SettingsLayer& env,
                                       const SettingsLayer& cli) {
    for (const SettingsLayer* layer : {&cli, &env, &file}) {
        auto it = layer->find(key);
        if (it != layer->end()) {
            std::string v = it->second;
            trim(v);
            if (!v.empty()) return v;
        }
    }
    return std::nullopt;
}

static std::string missing(const std::string& key) {
    return fmt::format("{} is not set (use --{}, {} or '{}:' in {})",
                       key, key, env_name_for(key), key, get_default_config_path().string());
}

Result<Config> Config::resolve(const SettingsLayer& file,
                               const SettingsLayer& env,
                               const SettingsLayer& cli) {
    auto get = [&](const std::string& key) { return pick(key, file, env, cli); };
    Config config;

    // Timestamps first: a bad window is reported before anything else
    auto start_text = get("vest-start");
    if (!start_text) return Result<Config>::Err(missing("vest-start"));
    auto start = parse_rfc3339(*start_text);
    if (start.is_err()) return Result<Config>::Err("vest-start: " + start.error);

    auto end_text = get("vest-end");
    if (!end_text) return Result<Config>::Err(missing("vest-end"));
    auto end = parse_rfc3339(*end_text);
    if (end.is_err()) return Result<Config>::Err("vest-end: " + end.error);

    if (end.value <= start.value) {
        return Result<Config>::Err(fmt::format("vest-end ({}) must be after vest-start ({})",
                                               *end_text, *start_text));
    }
    config.grant_.vest_start = start.value;
    config.grant_.vest_end = end.value;

    auto ticker = get("ticker");
    if (!ticker) return Result<Config>::Err(missing("ticker"));
    config.grant_.ticker = *ticker;

    auto api_key = get("apikey");
    if (!api_key) return Result<Config>::Err(missing("apikey"));
    config.api_key_ = *api_key;

    config.grant_.strike_price = DEFAULT_STRIKE_PRICE;
    if (auto text = get("strike-price")) {
        auto v = parse_decimal(*text);
        if (v.is_err()) return Result<Config>::Err("strike-price: " + v.error);
        if (v.value < 0) return Result<Config>::Err("strike-price must not be negative");
        config.grant_.strike_price = v.value;
    }

    config.grant_.total_shares = DEFAULT_SHARES;
    if (auto text = get("shares")) {
        auto v = parse_integer(*text);
        if (v.is_err()) return Result<Config>::Err("shares: " + v.error);
        if (v.value < 0) return Result<Config>::Err("shares must not be negative");
        config.grant_.total_shares = v.value;
    }

    config.grant_.shares_sold = DEFAULT_SHARES_SOLD;
    if (auto text = get("shares-sold")) {
        auto v = parse_integer(*text);
        if (v.is_err()) return Result<Config>::Err("shares-sold: " + v.error);
        if (v.value < 0) return Result<Config>::Err("shares-sold must not be negative");
        config.grant_.shares_sold = v.value;
    }

    config.money_.symbol = DEFAULT_CURRENCY;
    if (auto text = get("currency-symbol")) {
        config.money_.symbol = *text;
    }

    config.money_.precision = DEFAULT_CURRENCY_PRECISION;
    if (auto text = get("currency-precision")) {
        auto v = parse_integer(*text);
        if (v.is_err()) return Result<Config>::Err("currency-precision: " + v.error);
        if (v.value < 0 || v.value > 10) {
            return Result<Config>::Err("currency-precision must be between 0 and 10");
        }
        config.money_.precision = static_cast<int>(v.value);
    }

    return Result<Config>::Ok(config);
}

Result<Config> Config::load(const CliOptions& cli) {
    fs::path path;
    if (cli.config_path) {
        path = *cli.config_path;
        if (!fs::exists(path)) {
            return Result<Config>::Err("Config file not found at " + path.string());
        }
    } else {
        auto created = ensure_default_config();
        if (created.is_err()) {
            return Result<Config>::Err(created.error);
        }
        path = get_default_config_path();
    }

    auto file = read_config_file(path);
    if (file.is_err()) {
        return Result<Config>::Err(file.error);
    }
    SettingsLayer env = read_env_overrides();
    worth_log(fmt::format("config: {} key(s) from {}, {} from environment, {} from command line",
                          file.value.size(), path.string(), env.size(), cli.overrides.size()));

    auto result = resolve(file.value, env, cli.overrides);
    if (result.is_ok()) {
        result.value.source_path_ = path;
    }
    return result;
}
