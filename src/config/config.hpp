#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

// Thrown for unreadable, malformed or incomplete configuration.
struct ConfigError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Upper bounds accepted by Config::validate().
constexpr size_t                    MAX_WORKERS = 64;
constexpr std::chrono::milliseconds MAX_REQUEST_TIMEOUT{3600 * 1000};

struct Config {
    std::string               api_token;
    int64_t                   drive_id     = 0;
    std::string               base_url     = "https://api.infomaniak.com";
    size_t                    workers      = 5;
    double                    rate_per_sec = 10.0;
    size_t                    burst        = 20;
    std::chrono::milliseconds request_timeout{30000};

    // Throws ConfigError naming the first missing or invalid setting.
    void validate() const;
};

// Environment lookup; returns nullptr when the variable is unset.
using EnvLookup = std::function<const char*(const char*)>;

// Overlay the keys present in a config.json document onto `cfg`.
// Recognized keys: api_token, drive_id, base_url, workers, rate_per_sec,
// burst, request_timeout_s. Unknown keys are ignored.
void apply_json(Config& cfg, const std::string& json_text);

// Overlay DRIVESCAN_API_TOKEN, DRIVESCAN_DRIVE_ID and DRIVESCAN_BASE_URL.
void apply_env(Config& cfg, const EnvLookup& env);

// Candidate config files, in lookup order: $HOME/.config/drivescan,
// $HOME/.drivescan, then the working directory.
std::vector<std::string> config_search_paths(const EnvLookup& env);

// Defaults, then the first existing config file, then the environment.
// A missing config file is not an error.
Config load_config(const EnvLookup& env);
Config load_config();
