#include "config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace {

int64_t parse_int(const std::string& key, const char* text) {
    errno = 0;
    char* end = nullptr;
    const long long v = std::strtoll(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0')
        throw ConfigError(key + ": not an integer: '" + text + "'");
    return static_cast<int64_t>(v);
}

// JSON integer >= 1. Negative values must not wrap into huge unsigned counts.
int64_t positive_int(const nlohmann::json& j, const char* key) {
    const auto& v = j.at(key);
    if (!v.is_number_integer())
        throw ConfigError(std::string(key) + ": must be an integer");
    const int64_t n = v.get<int64_t>();
    if (n < 1)
        throw ConfigError(std::string(key) + " must be > 0, got " + std::to_string(n));
    return n;
}

}  // anonymous namespace

void Config::validate() const {
    if (api_token.empty())
        throw ConfigError("api_token required (config or DRIVESCAN_API_TOKEN)");
    if (drive_id == 0)
        throw ConfigError("drive_id required (config or DRIVESCAN_DRIVE_ID)");
    if (drive_id < 0)
        throw ConfigError("drive_id must be > 0, got " + std::to_string(drive_id));
    if (base_url.empty())
        throw ConfigError("base_url must not be empty (config or DRIVESCAN_BASE_URL)");
    if (workers == 0)
        throw ConfigError("workers must be > 0");
    if (workers > MAX_WORKERS)
        throw ConfigError("workers must be <= " + std::to_string(MAX_WORKERS) + ", got " +
                          std::to_string(workers));
    if (!(rate_per_sec > 0.0))
        throw ConfigError("rate_per_sec must be > 0");
    if (burst == 0)
        throw ConfigError("burst must be > 0");
    if (request_timeout.count() <= 0)
        throw ConfigError("request_timeout_s must be > 0");
    if (request_timeout > MAX_REQUEST_TIMEOUT)
        throw ConfigError("request_timeout_s must be <= " +
                          std::to_string(MAX_REQUEST_TIMEOUT.count() / 1000));
}

void apply_json(Config& cfg, const std::string& json_text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError(std::string("config parse error: ") + e.what());
    }
    if (!j.is_object())
        throw ConfigError("config parse error: top level must be an object");

    try {
        if (j.contains("api_token"))    cfg.api_token    = j["api_token"].get<std::string>();
        if (j.contains("drive_id"))     cfg.drive_id     = j["drive_id"].get<int64_t>();
        if (j.contains("base_url"))     cfg.base_url     = j["base_url"].get<std::string>();
        if (j.contains("workers"))
            cfg.workers = static_cast<size_t>(positive_int(j, "workers"));
        if (j.contains("rate_per_sec")) cfg.rate_per_sec = j["rate_per_sec"].get<double>();
        if (j.contains("burst"))
            cfg.burst = static_cast<size_t>(positive_int(j, "burst"));
        if (j.contains("request_timeout_s")) {
            const double secs = j["request_timeout_s"].get<double>();
            const double max_secs = MAX_REQUEST_TIMEOUT.count() / 1000.0;
            if (!std::isfinite(secs) || secs <= 0.0 || secs > max_secs)
                throw ConfigError("request_timeout_s must be in (0, " +
                                  std::to_string(MAX_REQUEST_TIMEOUT.count() / 1000) + "]");
            cfg.request_timeout =
                std::chrono::milliseconds(static_cast<int64_t>(secs * 1000.0));
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("config parse error: ") + e.what());
    }
}

void apply_env(Config& cfg, const EnvLookup& env) {
    if (const char* v = env("DRIVESCAN_API_TOKEN"); v && *v)
        cfg.api_token = v;
    if (const char* v = env("DRIVESCAN_DRIVE_ID"); v && *v)
        cfg.drive_id = parse_int("DRIVESCAN_DRIVE_ID", v);
    if (const char* v = env("DRIVESCAN_BASE_URL"); v && *v)
        cfg.base_url = v;
}

std::vector<std::string> config_search_paths(const EnvLookup& env) {
    std::vector<std::string> paths;
    if (const char* home = env("HOME"); home && *home) {
        paths.push_back(std::string(home) + "/.config/drivescan/config.json");
        paths.push_back(std::string(home) + "/.drivescan/config.json");
    }
    paths.push_back("config.json");
    return paths;
}

Config load_config(const EnvLookup& env) {
    Config cfg;

    for (const auto& path : config_search_paths(env)) {
        std::ifstream in(path);
        if (!in) continue;
        std::stringstream ss;
        ss << in.rdbuf();
        if (in.bad())
            throw ConfigError("config read error: " + path);
        spdlog::debug("loading config path={}", path);
        apply_json(cfg, ss.str());
        break;
    }

    apply_env(cfg, env);
    return cfg;
}

Config load_config() {
    return load_config([](const char* name) { return std::getenv(name); });
}
