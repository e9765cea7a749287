#pragma once
#include "agent_transport.hpp"
#include "discovery.hpp"
#include "../../../shared/cpp/bridge_sdk/include/message.hpp"
#include <atomic>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

enum class ConnectionState { Disconnected, Connected };

const char* to_string(ConnectionState state);

// Agent-side view of whether the controller is reachable. Only transition()
// mutates it, and observers hear about actual changes only.
class ConnectionStatus {
public:
    using Observer = std::function<void(ConnectionState state, int port)>;

    void subscribe(Observer obs);
    // Returns true (and notifies) only if the state changed.
    bool transition(ConnectionState next, int port = 0);
    ConnectionState state() const;

private:
    mutable std::mutex mtx_;
    ConnectionState state_{ConnectionState::Disconnected};
    std::vector<Observer> observers_;
};

struct PollerOptions {
    long poll_timeout_ms{3000};
    long result_timeout_ms{3000};
    bool announce{true};              // post agent_ready on each reconnect
    std::string agent_version{"0.1.0"};
};

// Drives one discover -> poll -> dispatch -> post-result cycle per tick().
// The tick source is external (a timer or the main loop).
class AgentPoller {
public:
    // Returns the reply to post back, or nullopt for none.
    using MessageHandler = std::function<std::optional<BridgeMessage>(const BridgeMessage&)>;

    AgentPoller(Discovery& discovery, AgentTransport& transport, MessageHandler handler,
                PollerOptions opts = PollerOptions());

    // Runs one cycle. Returns false without doing anything if a previous
    // cycle is still in flight. Never throws for network failures.
    bool tick();

    ConnectionState state() const { return status_.state(); }
    void on_status_change(ConnectionStatus::Observer obs) { status_.subscribe(std::move(obs)); }

private:
    void run_cycle();
    void exchange(const BridgeCacheEntry& bridge);
    void announce(const BridgeCacheEntry& bridge);

    Discovery& discovery_;
    AgentTransport& transport_;
    MessageHandler handler_;
    PollerOptions opts_;
    ConnectionStatus status_;
    std::atomic<bool> in_flight_{false};
    std::vector<BridgeMessage> unsent_; // touched only inside a tick

};
