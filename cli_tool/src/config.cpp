#include "config.hpp"

#include <unistd.h>

#include <cstdlib>
#include <fstream>
#include <limits>
#include <system_error>

#include "error.hpp"

namespace fs = std::filesystem;

namespace {
std::optional<std::string> lookup(const Config::EnvLookup& env, const char* name) {
    const char* value = env(name);
    if (!value || !*value) return std::nullopt;
    return std::string(value);
}

uint32_t positive_from_json(const json& value, std::string_view what) {
    if (value.is_number_unsigned() && value.get<uint64_t>() > 0 &&
        value.get<uint64_t>() <= std::numeric_limits<uint32_t>::max()) {
        return static_cast<uint32_t>(value.get<uint64_t>());
    }
    if (value.is_string()) return Config::parse_positive(value.get<std::string>(), what);
    throw UsageError(std::string(what) + " must be a positive integer");
}
}  // namespace

namespace Config {
uint32_t parse_positive(std::string_view text, std::string_view what) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string_view::npos || text.size() > 10) {
        throw UsageError(std::string(what) + " must be a positive integer, got '" + std::string(text) + "'");
    }
    const uint64_t value = std::stoull(std::string(text));
    if (value == 0 || value > std::numeric_limits<uint32_t>::max()) {
        throw UsageError(std::string(what) + " must be a positive integer, got '" + std::string(text) + "'");
    }
    return static_cast<uint32_t>(value);
}

fs::path default_path(const EnvLookup& env) {
    if (auto xdg = lookup(env, "XDG_CONFIG_HOME")) {
        return fs::path(*xdg) / "transfersh" / "config.json";
    }
    if (auto home = lookup(env, "HOME")) {
        return fs::path(*home) / ".config" / "transfersh" / "config.json";
    }
    return {};
}

void apply_json(Settings& settings, const json& data) {
    if (!data.is_object()) {
        throw UsageError("Configuration must be a JSON object");
    }
    try {
        if (data.contains("url")) settings.service_url = data["url"].get<std::string>();
        if (data.contains("max_days")) settings.max_days = positive_from_json(data["max_days"], "max_days");
        if (data.contains("max_downloads")) {
            settings.max_downloads = positive_from_json(data["max_downloads"], "max_downloads");
        }
        if (data.contains("encryption_key")) settings.encryption_key = data["encryption_key"].get<std::string>();
        if (data.contains("auth_user")) settings.auth_user = data["auth_user"].get<std::string>();
        if (data.contains("auth_pass")) settings.auth_pass = data["auth_pass"].get<std::string>();
        if (data.contains("log_level")) {
            const auto text = data["log_level"].get<std::string>();
            auto level = Log::parse_level(text);
            if (!level) throw UsageError("Invalid log level in configuration: " + text);
            settings.log_level = *level;
        }
        if (data.contains("tmp_dir")) set_tmp_dir(settings, data["tmp_dir"].get<std::string>());
        if (data.contains("read_timeout_seconds")) {
            settings.read_timeout = std::chrono::seconds(positive_from_json(data["read_timeout_seconds"], "read_timeout_seconds"));
        }
    } catch (const json::exception& e) {
        throw UsageError(std::string("Invalid configuration value: ") + e.what());
    }
}

void apply_file(Settings& settings, const fs::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw UsageError("Cannot open configuration file: " + path.string());
    }
    json data;
    try {
        data = json::parse(in);
    } catch (const json::parse_error& e) {
        throw UsageError("Cannot parse configuration file " + path.string() + ": " + e.what());
    }
    apply_json(settings, data);
    Log::debug("Loaded configuration from " + path.string());
}

void apply_environment(Settings& settings, const EnvLookup& env) {
    if (auto url = lookup(env, "TRANSFERSH_URL")) settings.service_url = *url;
    if (auto days = lookup(env, "TRANSFERSH_MAX_DAYS")) settings.max_days = parse_positive(*days, "TRANSFERSH_MAX_DAYS");
    if (auto downloads = lookup(env, "TRANSFERSH_MAX_DOWNLOADS")) {
        settings.max_downloads = parse_positive(*downloads, "TRANSFERSH_MAX_DOWNLOADS");
    }
    if (auto key = lookup(env, "TRANSFERSH_ENCRYPTION_KEY")) settings.encryption_key = *key;
    if (auto user = lookup(env, "AUTH_USER")) settings.auth_user = *user;
    if (auto pass = lookup(env, "AUTH_PASS")) settings.auth_pass = *pass;
    if (auto level = lookup(env, "LOG_LEVEL")) {
        auto parsed = Log::parse_level(*level);
        if (!parsed) throw UsageError("Invalid log level: " + *level + ". Must be ERROR, WARN, INFO, or DEBUG.");
        settings.log_level = *parsed;
    }
}

void set_tmp_dir(Settings& settings, const fs::path& dir) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec) || ::access(dir.c_str(), W_OK) != 0) {
        throw UsageError("Temporary directory '" + dir.string() + "' does not exist or is not writable.");
    }
    settings.tmp_dir = dir;
}

Settings load(const std::optional<fs::path>& config_file, const EnvLookup& env) {
    Settings settings;
    std::error_code ec;
    settings.tmp_dir = fs::temp_directory_path(ec);
    if (ec) settings.tmp_dir = "/tmp";

    if (config_file) {
        apply_file(settings, *config_file);
    } else if (const fs::path fallback = default_path(env); !fallback.empty() && fs::exists(fallback, ec)) {
        apply_file(settings, fallback);
    }
    apply_environment(settings, env);
    return settings;
}

Settings load(const std::optional<fs::path>& config_file) {
    return load(config_file, [](const char* name) { return std::getenv(name); });
}

std::optional<Credentials> credentials(const Settings& settings) {
    if (!settings.auth_user.empty() && !settings.auth_pass.empty()) {
        return Credentials{settings.auth_user, settings.auth_pass};
    }
    if (!settings.auth_user.empty() || !settings.auth_pass.empty()) {
        Log::warn("Username or password for basic auth is missing. Auth will not be used.");
    }
    return std::nullopt;
}
}  // namespace Config
