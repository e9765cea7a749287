#include "../include/config.hpp"
#include "../../../shared/cpp/bridge_sdk/include/log.hpp"
#include "../../../shared/cpp/bridge_sdk/include/util.hpp"
#include <climits>
#include <cstdint>

using json = nlohmann::json;

BridgeConfig default_config() {
    return BridgeConfig{};
}

void apply_config_json(BridgeConfig& cfg, const json& j) {
    if (!j.is_object()) return;
    auto set_int = [&](const char* key, int& out, int64_t lo, int64_t hi) {
        auto it = j.find(key);
        if (it == j.end() || !it->is_number_integer()) return;
        if (it->is_number_unsigned() && it->get<uint64_t>() > static_cast<uint64_t>(hi)) return;
        int64_t v = it->get<int64_t>();
        if (v >= lo && v <= hi) out = static_cast<int>(v);
    };
    auto set_str = [&](const char* key, std::string& out) {
        auto it = j.find(key);
        if (it != j.end() && it->is_string()) out = it->get<std::string>();
    };
    set_int("bridgePort", cfg.bridge_port, 1, 65535);
    set_int("timeoutMs", cfg.timeout_ms, 1, INT_MAX);
    set_int("pollIntervalMs", cfg.poll_interval_ms, 1, INT_MAX);
    set_str("watchDir", cfg.watch_dir);
    set_str("baseUrl", cfg.base_url);
}

json config_to_json(const BridgeConfig& cfg) {
    return json{
        {"bridgePort", cfg.bridge_port},
        {"timeoutMs", cfg.timeout_ms},
        {"pollIntervalMs", cfg.poll_interval_ms},
        {"watchDir", cfg.watch_dir},
        {"baseUrl", cfg.base_url.empty() ? json(nullptr) : json(cfg.base_url)}
    };
}

BridgeConfig load_config(const std::filesystem::path& project_root) {
    BridgeConfig cfg = default_config();

    auto path = project_root / "bridge.config.json";
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        try {
            json j = json::parse(read_text_file(path), nullptr, false);
            if (j.is_object()) apply_config_json(cfg, j);
            else Logger("config").warn("Ignoring invalid config file", {{"path", path.string()}});
        } catch (const std::exception& e) {
            Logger("config").warn("Could not read config file", {{"path", path.string()}, {"error", e.what()}});
        }
    }

    int port = getenv_int_or("BRIDGE_PORT", cfg.bridge_port);
    if (is_valid_port(port)) cfg.bridge_port = port;
    else Logger("config").warn("Ignoring out-of-range BRIDGE_PORT", {{"value", port}});
    int timeout = getenv_int_or("BRIDGE_TIMEOUT_MS", cfg.timeout_ms);
    if (timeout > 0) cfg.timeout_ms = timeout;
    int poll = getenv_int_or("BRIDGE_POLL_MS", cfg.poll_interval_ms);
    if (poll > 0) cfg.poll_interval_ms = poll;
    cfg.base_url = getenv_or("BRIDGE_BASE_URL", cfg.base_url);
    return cfg;
}
