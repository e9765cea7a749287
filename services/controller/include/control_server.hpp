#pragma once
#include "message_queue.hpp"
#include "../../../shared/cpp/bridge_sdk/include/message.hpp"
#include <atomic>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct MHD_Daemon;

// Walks [start, start + count) in order and returns the first port for which
// try_bind succeeds.
std::optional<int> first_available_port(int start, int count, const std::function<bool(int)>& try_bind);

struct ControlServerOptions {
    int preferred_port{7890};
    int port_range{10};
    std::string base_url;                            // reported by /health, empty -> null
    nlohmann::json config = nlohmann::json::object(); // served by GET /config
    std::filesystem::path config_path;                 // POST /config persists here, empty -> memory only
};

struct HttpReply {
    int status{200};
    std::string body;
};

// Loopback HTTP control surface. The agent polls it for queued messages and
// posts results back; the controller never opens an outbound connection.
//
//   GET  /health   no auth   {ok, token, port, version, baseUrl}
//   GET  /poll     token     {messages: [...]}, drains the queue
//   POST /result   token     {message} -> result subscribers
//   POST /enqueue  token     {message} -> queue
//   GET  /config   token     {ok, config}
//   POST /config   token     {config} replaces and persists it
//   OPTIONS *      no auth   204 + CORS
class ControlServer {
public:
    using ResultCallback = std::function<void(const BridgeMessage&)>;

    static constexpr const char* kVersion = "0.1.0";
    static constexpr const char* kTokenHeader = "X-Bridge-Token";
    static constexpr int kDefaultPortRange = 10;

    explicit ControlServer(ControlServerOptions opts = ControlServerOptions());
    ~ControlServer();

    ControlServer(const ControlServer&) = delete;
    ControlServer& operator=(const ControlServer&) = delete;

    // Binds 127.0.0.1 and returns the bound port. Throws TransportUnavailable
    // when every port in the range is taken.
    int start();
    // Idempotent.
    void stop();

    bool running() const { return daemon_ != nullptr; }
    int port() const { return port_.load(); }
    const std::string& token() const { return token_; }
    std::string base_url() const;

    void enqueue(BridgeMessage msg);
    std::size_t queued() { return queue_.size(); }
    // Subscribers run on the HTTP thread, in registration order.
    void on_result(ResultCallback cb);

    // Routing core, independent of the socket layer. token is empty when the
    // header was absent.
    HttpReply handle_request(const std::string& method, const std::string& path,
                             const std::string& token, const std::string& body);

private:
    bool try_listen(int port);
    bool authorized(const std::string& token) const { return !token.empty() && token == token_; }

    HttpReply handle_health() const;
    HttpReply handle_poll();
    HttpReply handle_result(const std::string& body);
    HttpReply handle_enqueue(const std::string& body);
    HttpReply handle_config() const;
    HttpReply handle_config_update(const std::string& body);

    ControlServerOptions opts_;
    std::string token_;
    std::atomic<int> port_{0};
    MHD_Daemon* daemon_{nullptr};
    MessageQueue queue_;

    mutable std::mutex config_mtx_; // guards opts_.config

    std::mutex cb_mtx_;
    std::vector<ResultCallback> callbacks_;
};
