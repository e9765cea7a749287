#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

struct BridgeConfig {
    int bridge_port{7890};         // first port of the 10-port range
    int timeout_ms{30000};         // per-request timeout
    int poll_interval_ms{500};     // file transport inbox scan interval
    std::string watch_dir{"src/frontend"};
    std::string base_url;          // dev server URL reported by /health; empty = none
};

BridgeConfig default_config();

// Overlays the keys present in j (camelCase, as in bridge.config.json).
// Keys with the wrong JSON type are ignored.
void apply_config_json(BridgeConfig& cfg, const nlohmann::json& j);
nlohmann::json config_to_json(const BridgeConfig& cfg);

// defaults < <project>/bridge.config.json < BRIDGE_* environment variables.
// A missing or malformed file falls back to the defaults.
BridgeConfig load_config(const std::filesystem::path& project_root);
