#pragma once
#include "config.hpp"
#include "control_server.hpp"
#include "../../../shared/cpp/bridge_sdk/include/file_transport.hpp"
#include "../../../shared/cpp/bridge_sdk/include/message.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

struct BridgeClientOptions {
    std::filesystem::path project_root{"."};
    int bridge_port{7890};
    int port_range{ControlServer::kDefaultPortRange};
    int timeout_ms{30000};
    int poll_interval_ms{FileTransport::kDefaultPollIntervalMs};
    std::string watch_dir{"src/frontend"};
    std::string base_url;
};

BridgeClientOptions client_options(const std::filesystem::path& project_root, const BridgeConfig& cfg);

// Controller-side entry point to the bridge. connect() brings up the HTTP
// control server, or the file mailbox when no port in the range can be bound;
// exactly one of the two is active afterwards.
//
// Requests are correlated with results by plan id. Only one request per plan
// id may be pending at a time.
class BridgeClient {
public:
    static constexpr const char* kControllerVersion = "0.1.0";

    explicit BridgeClient(BridgeClientOptions opts);
    ~BridgeClient();

    BridgeClient(const BridgeClient&) = delete;
    BridgeClient& operator=(const BridgeClient&) = delete;

    void connect();
    // Stops the transport, removes bridge.json and fails every pending
    // request with DisconnectedError.
    void disconnect();

    // Sends start_session for plan_id. Throws NotConnectedError before
    // connect() and DuplicateRequestError if plan_id is already pending.
    // The future fails with RequestTimeoutError after timeout_ms
    // (options default when negative) or DisconnectedError.
    std::future<SessionResult> send_request(const std::string& plan_id,
                                            const nlohmann::json& payload,
                                            int timeout_ms = -1);

    bool connected() const { return connected_.load(); }
    // "http", "file", or "none" before connect().
    std::string transport() const;
    int port() const;
    std::string token() const;
    std::size_t pending_count();

private:
    struct Pending {
        std::promise<SessionResult> promise;
        std::chrono::steady_clock::time_point deadline;
        int timeout_ms{0};
    };

    bool connect_http();
    void connect_file();
    void handle_incoming(const BridgeMessage& msg);
    void reaper_loop();
    BridgeMessage handshake() const;

    BridgeClientOptions opts_;

    mutable std::mutex transport_mtx_; // guards server_, files_, transport_
    std::unique_ptr<ControlServer> server_;
    std::unique_ptr<FileTransport> files_;
    std::string transport_{"none"};
    std::atomic<bool> connected_{false};

    std::mutex mtx_; // guards pending_, stopping_
    std::condition_variable cv_;
    std::map<std::string, Pending> pending_;
    bool stopping_{false};
    std::thread reaper_;
};
