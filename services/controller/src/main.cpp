#include <iostream>
#include <string>
#include <filesystem>
#include <signal.h>
#include <unistd.h>
#include <nlohmann/json.hpp>
#include "../include/bridge_client.hpp"
#include "../include/config.hpp"
#include "../include/control_server.hpp"
#include "../../../shared/cpp/bridge_sdk/include/credential.hpp"
#include "../../../shared/cpp/bridge_sdk/include/errors.hpp"
#include "../../../shared/cpp/bridge_sdk/include/log.hpp"
#include "../../../shared/cpp/bridge_sdk/include/util.hpp"

using json = nlohmann::json;

static void usage() {
    std::cerr << "bridge_controller usage:\n"
              << "  serve  [--project <dir>] [--port N]\n"
              << "  run    --plan <id> [--payload <file>] [--timeout-ms N] [--project <dir>] [--port N]\n"
              << "  status [--project <dir>]\n"
              << "  stop   [--project <dir>]\n";
}

static int cmd_serve(const std::filesystem::path& root, const BridgeConfig& cfg) {
    const Logger log("serve");
    // Must precede server.start(): the daemon thread inherits the mask.
    sigset_t stop_signals = block_shutdown_signals();
    ControlServerOptions so;
    so.preferred_port = cfg.bridge_port;
    so.base_url = cfg.base_url;
    so.config = config_to_json(cfg);
    so.config_path = root / "bridge.config.json";
    ControlServer server(so);
    int port = server.start();

    Credential cred{port, server.token(), static_cast<long>(::getpid()), iso8601_utc(now_ms())};
    write_credential(root, cred);

    server.on_result([&log](const BridgeMessage& msg) {
        log.info(std::string("Result received: ") + to_string(msg.type()), msg.payload());
    });

    log.info("Bridge server running on " + server.base_url());
    log.info("Press Ctrl+C to stop.");

    int sig = wait_for_shutdown_signal(stop_signals);

    log.info("Shutting down...", {{"signal", sig}});
    server.stop();
    remove_credential(root);
    return 0;
}

static int cmd_run(const std::filesystem::path& root, const BridgeConfig& cfg, const std::string& plan_id,
                   const std::string& payload_file, int timeout_ms) {
    json payload = json::object();
    if (!payload_file.empty()) {
        payload = json::parse(read_text_file(payload_file));
    }

    BridgeClient client(client_options(root, cfg));
    client.connect();
    std::cout << "[controller] Transport: " << client.transport() << std::endl;
    int rc = 1;
    try {
        auto fut = client.send_request(plan_id, payload, timeout_ms);
        SessionResult r = fut.get();
        std::cout << r.payload.dump(2) << std::endl;
        rc = r.passed ? 0 : 3;
    } catch (const BridgeError& e) {
        std::cerr << "[controller] " << e.what() << std::endl;
    }
    client.disconnect();
    return rc;
}

static int cmd_status(const std::filesystem::path& root) {
    auto info = read_credential(root);
    if (!info) {
        std::cout << "Bridge: not running (no bridge.json)" << std::endl;
        return 1;
    }
    if (!is_process_alive(info->pid)) {
        std::cout << "Bridge: not running (stale bridge.json, pid " << info->pid << ")" << std::endl;
        return 1;
    }
    int64_t started = parse_iso8601_utc(info->started_at);
    std::cout << "Bridge: running\n"
              << "  pid:    " << info->pid << "\n"
              << "  port:   " << info->port << "\n"
              << "  uptime: " << (started < 0 ? std::string("unknown") : format_uptime(now_ms() - started))
              << std::endl;
    return 0;
}

static int cmd_stop(const std::filesystem::path& root) {
    auto info = read_credential(root);
    if (!info) {
        std::cout << "Bridge: nothing to stop (no bridge.json)" << std::endl;
        return 1;
    }
    if (!is_process_alive(info->pid)) {
        remove_credential(root);
        std::cout << "Bridge: not running, removed stale bridge.json" << std::endl;
        return 1;
    }
    if (::kill(static_cast<pid_t>(info->pid), SIGTERM) != 0) {
        std::cerr << "Bridge: could not signal pid " << info->pid << std::endl;
        return 1;
    }
    remove_credential(root);
    std::cout << "Bridge: stopped pid " << info->pid << " (port " << info->port << ")" << std::endl;
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) { usage(); return 1; }
    std::string cmd = argv[1];
    try {
        std::filesystem::path root = std::filesystem::current_path();
        std::string plan_id;
        std::string payload_file;
        int port = -1;
        int timeout_ms = -1;
        for (int i = 2; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--project" && i + 1 < argc) root = argv[++i];
            else if (a == "--plan" && i + 1 < argc) plan_id = argv[++i];
            else if (a == "--payload" && i + 1 < argc) payload_file = argv[++i];
            else if (a == "--port" && i + 1 < argc) port = std::stoi(argv[++i]);
            else if (a == "--timeout-ms" && i + 1 < argc) timeout_ms = std::stoi(argv[++i]);
            else { usage(); return 2; }
        }

        BridgeConfig cfg = load_config(root);
        if (port != -1) {
            if (!is_valid_port(port)) {
                std::cerr << "[ERROR] --port must be between 1 and 65535\n";
                return 2;
            }
            cfg.bridge_port = port;
        }

        if (cmd == "serve") return cmd_serve(root, cfg);
        if (cmd == "run") {
            if (plan_id.empty()) { usage(); return 2; }
            return cmd_run(root, cfg, plan_id, payload_file, timeout_ms);
        }
        if (cmd == "status") return cmd_status(root);
        if (cmd == "stop") return cmd_stop(root);
        usage();
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }
}
