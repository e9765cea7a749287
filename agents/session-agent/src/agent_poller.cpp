#include "../include/agent_poller.hpp"
#include "../../../shared/cpp/bridge_sdk/include/errors.hpp"
#include "../../../shared/cpp/bridge_sdk/include/log.hpp"

using json = nlohmann::json;

namespace {
const Logger log_("poller");
constexpr std::size_t kMaxUnsent = 256;
}

const char* to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connected: return "connected";
    }
    return "disconnected";
}

void ConnectionStatus::subscribe(Observer obs) {
    std::lock_guard<std::mutex> lock(mtx_);
    observers_.push_back(std::move(obs));
}

bool ConnectionStatus::transition(ConnectionState next, int port) {
    std::vector<Observer> observers;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (state_ == next) return false;
        state_ = next;
        observers = observers_;
    }
    log_.info(std::string("Controller ") + to_string(next), port ? json{{"port", port}} : json());
    for (const auto& obs : observers) {
        try {
            obs(next, port);
        } catch (const std::exception& e) {
            log_.error("Status observer failed", {{"error", e.what()}});
        }
    }
    return true;
}

ConnectionState ConnectionStatus::state() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return state_;
}

AgentPoller::AgentPoller(Discovery& discovery, AgentTransport& transport, MessageHandler handler, PollerOptions opts)
    : discovery_(discovery), transport_(transport), handler_(std::move(handler)), opts_(std::move(opts)) {}

bool AgentPoller::tick() {
    bool expected = false;
    if (!in_flight_.compare_exchange_strong(expected, true)) {
        log_.debug("Previous poll cycle still running, skipping tick");
        return false;
    }
    try {
        run_cycle();
    } catch (const std::exception& e) {
        log_.warn("Poll error", {{"error", e.what()}});
        status_.transition(ConnectionState::Disconnected);
    }
    in_flight_ = false;
    return true;
}

void AgentPoller::run_cycle() {
    auto bridge = discovery_.discover();
    if (!bridge) {
        status_.transition(ConnectionState::Disconnected);
        return;
    }

    try {
        exchange(*bridge);
    } catch (const UnauthorizedError&) {
        log_.warn("Token rejected, rediscovering", {{"port", bridge->port}});
        discovery_.invalidate();
        bridge = discovery_.discover();
        if (!bridge) {
            status_.transition(ConnectionState::Disconnected);
            return;
        }
        exchange(*bridge);
    }

    if (status_.transition(ConnectionState::Connected, bridge->port) && opts_.announce) {
        announce(*bridge);
    }
}

// Replies whose post failed are kept and retried first on the next exchange.
// A failed post never stops the rest of an already drained batch; the first
// failure is rethrown once the batch is done.
void AgentPoller::exchange(const BridgeCacheEntry& bridge) {
    std::exception_ptr first_error;
    auto deliver = [&](BridgeMessage reply, std::vector<BridgeMessage>& retry) {
        try {
            transport_.post_result(bridge.port, bridge.token, reply, opts_.result_timeout_ms);
        } catch (const HttpError& e) {
            if (e.status != 0 && e.status != 401 && e.status < 500) {
                log_.error("Result rejected by controller, dropping",
                           {{"type", to_string(reply.type())}, {"status", e.status}, {"error", e.what()}});
                return;
            }
            log_.warn("Could not post result, will retry", {{"type", to_string(reply.type())}, {"error", e.what()}});
            if (!first_error) first_error = std::current_exception();
            retry.push_back(std::move(reply));
        } catch (const std::exception& e) {
            log_.warn("Could not post result, will retry", {{"type", to_string(reply.type())}, {"error", e.what()}});
            if (!first_error) first_error = std::current_exception();
            retry.push_back(std::move(reply));
        }
    };

    std::vector<BridgeMessage> still_unsent;
    std::vector<BridgeMessage> backlog;
    backlog.swap(unsent_);
    for (auto& reply : backlog) deliver(std::move(reply), still_unsent);

    std::vector<nlohmann::json> raw;
    try {
        raw = transport_.poll(bridge.port, bridge.token, opts_.poll_timeout_ms);
    } catch (const std::exception&) {
        unsent_.swap(still_unsent);
        throw;
    }
    for (const auto& item : raw) {
        ValidationResult v = validate_message(item);
        if (!v.valid) {
            log_.warn("Skipping invalid message", {{"error", v.error}});
            continue;
        }
        std::optional<BridgeMessage> reply;
        try {
            reply = handler_(*v.message);
        } catch (const std::exception& e) {
            log_.error("Message handler failed", {{"type", to_string(v.message->type())}, {"error", e.what()}});
            continue;
        }
        if (reply) deliver(std::move(*reply), still_unsent);
    }

    if (still_unsent.size() > kMaxUnsent) {
        log_.error("Dropping oldest undelivered results", {{"count", still_unsent.size() - kMaxUnsent}});
        still_unsent.erase(still_unsent.begin(), still_unsent.end() - static_cast<std::ptrdiff_t>(kMaxUnsent));
    }
    unsent_.swap(still_unsent);
    if (first_error) std::rethrow_exception(first_error);
}

void AgentPoller::announce(const BridgeCacheEntry& bridge) {
    try {
        transport_.post_result(bridge.port, bridge.token,
                               BridgeMessage::create(MessageType::AgentReady, json{{"agentVersion", opts_.agent_version}}),
                               opts_.result_timeout_ms);
    } catch (const std::exception& e) {
        log_.warn("Could not announce agent", {{"error", e.what()}});
    }
}
