#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

#include "log.hpp"
#include "types.h"

using json = nlohmann::json;

struct Settings {
    std::string service_url{DEFAULT_SERVICE_URL};
    std::optional<uint32_t> max_days;
    std::optional<uint32_t> max_downloads;
    std::optional<std::string> encryption_key;
    std::string auth_user;
    std::string auth_pass;
    Log::Level log_level = Log::Level::Info;
    std::filesystem::path tmp_dir;
    std::chrono::seconds read_timeout{300};
};

namespace Config {
using EnvLookup = std::function<const char*(const char*)>;

// Positive decimal integer or UsageError naming `what`.
uint32_t parse_positive(std::string_view text, std::string_view what);

// $XDG_CONFIG_HOME/transfersh/config.json, else ~/.config/transfersh/config.json.
std::filesystem::path default_path(const EnvLookup& env);

void apply_json(Settings& settings, const json& data);
void apply_file(Settings& settings, const std::filesystem::path& path);
void apply_environment(Settings& settings, const EnvLookup& env);

// Must be an existing, writable directory.
void set_tmp_dir(Settings& settings, const std::filesystem::path& dir);

// defaults < config file < environment. An explicit config file must exist.
Settings load(const std::optional<std::filesystem::path>& config_file, const EnvLookup& env);
Settings load(const std::optional<std::filesystem::path>& config_file);

// Basic auth is only used when both halves are present.
std::optional<Credentials> credentials(const Settings& settings);
}  // namespace Config
