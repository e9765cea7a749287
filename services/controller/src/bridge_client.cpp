#include "../include/bridge_client.hpp"
#include "../../../shared/cpp/bridge_sdk/include/credential.hpp"
#include "../../../shared/cpp/bridge_sdk/include/errors.hpp"
#include "../../../shared/cpp/bridge_sdk/include/log.hpp"
#include "../../../shared/cpp/bridge_sdk/include/util.hpp"
#include <algorithm>
#include <unistd.h>
#include <vector>

using json = nlohmann::json;

namespace {
const Logger log_("client");
}

BridgeClientOptions client_options(const std::filesystem::path& project_root, const BridgeConfig& cfg) {
    BridgeClientOptions o;
    o.project_root = project_root;
    o.bridge_port = cfg.bridge_port;
    o.timeout_ms = cfg.timeout_ms;
    o.poll_interval_ms = cfg.poll_interval_ms;
    o.watch_dir = cfg.watch_dir;
    o.base_url = cfg.base_url;
    return o;
}

BridgeClient::BridgeClient(BridgeClientOptions opts) : opts_(std::move(opts)) {
    reaper_ = std::thread(&BridgeClient::reaper_loop, this);
}

BridgeClient::~BridgeClient() {
    disconnect();
    {
        std::lock_guard<std::mutex> lock(mtx_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (reaper_.joinable()) reaper_.join();
}

BridgeMessage BridgeClient::handshake() const {
    return BridgeMessage::create(MessageType::ControllerReady,
                                 json{{"controllerVersion", kControllerVersion}, {"watchDir", opts_.watch_dir}});
}

bool BridgeClient::connect_http() {
    ControlServerOptions so;
    so.preferred_port = opts_.bridge_port;
    so.port_range = opts_.port_range;
    so.base_url = opts_.base_url;
    so.config = json{{"watchDir", opts_.watch_dir}, {"timeoutMs", opts_.timeout_ms}};
    so.config_path = opts_.project_root / "bridge.config.json";
    auto server = std::make_unique<ControlServer>(so);
    try {
        int port = server->start();

        Credential cred;
        cred.port = port;
        cred.token = server->token();
        cred.pid = static_cast<long>(::getpid());
        cred.started_at = iso8601_utc(now_ms());
        write_credential(opts_.project_root, cred);
        log_.debug("Wrote bridge.json", {{"port", port}});
    } catch (const std::exception& e) {
        log_.warn("HTTP bridge failed, falling back to file IPC", {{"error", e.what()}});
        return false;
    }

    server->on_result([this](const BridgeMessage& msg) { handle_incoming(msg); });
    server->enqueue(handshake());
    log_.info("Connected via HTTP bridge on port " + std::to_string(server->port()));
    server_ = std::move(server);
    transport_ = "http";
    return true;
}

void BridgeClient::connect_file() {
    auto files = std::make_unique<FileTransport>(opts_.project_root, Mailbox::Controller, opts_.poll_interval_ms);
    files->on_message([this](const BridgeMessage& msg) { handle_incoming(msg); });
    files->connect();
    files->send(handshake());
    files_ = std::move(files);
    transport_ = "file";
    log_.info("Connected via file-based IPC (fallback)");
}

void BridgeClient::connect() {
    std::lock_guard<std::mutex> lock(transport_mtx_);
    if (connected_.load()) return;
    if (!connect_http()) connect_file();
    connected_ = true;
}

void BridgeClient::disconnect() {
    {
        std::lock_guard<std::mutex> lock(transport_mtx_);
        if (server_) {
            server_->stop();
            server_.reset();
            remove_credential(opts_.project_root);
        }
        if (files_) {
            files_->disconnect();
            files_.reset();
        }
        bool was_connected = connected_.exchange(false);
        transport_ = "none";
        if (was_connected) log_.info("Disconnected from agent");
    }

    std::map<std::string, Pending> orphaned;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        orphaned.swap(pending_);
    }
    for (auto& kv : orphaned) {
        kv.second.promise.set_exception(std::make_exception_ptr(DisconnectedError()));
    }
    cv_.notify_all();
}

std::future<SessionResult> BridgeClient::send_request(const std::string& plan_id, const json& payload, int timeout_ms) {
    std::lock_guard<std::mutex> tlock(transport_mtx_);
    if (!connected_.load()) throw NotConnectedError();

    const int effective_timeout = timeout_ms >= 0 ? timeout_ms : opts_.timeout_ms;
    std::future<SessionResult> fut;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (pending_.count(plan_id)) throw DuplicateRequestError(plan_id);
        Pending& p = pending_[plan_id];
        p.deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(effective_timeout);
        p.timeout_ms = effective_timeout;
        fut = p.promise.get_future();
    }
    cv_.notify_all();

    BridgeMessage msg = make_start_session(plan_id, payload);
    try {
        if (server_) server_->enqueue(msg);
        else files_->send(msg);
    } catch (const std::exception& e) {
        log_.error("Failed to send start_session", {{"planId", plan_id}, {"error", e.what()}});
        std::lock_guard<std::mutex> lock(mtx_);
        pending_.erase(plan_id);
        throw;
    }
    log_.info("Session requested", {{"planId", plan_id}, {"transport", transport_}});
    return fut;
}

std::string BridgeClient::transport() const {
    std::lock_guard<std::mutex> lock(transport_mtx_);
    return transport_;
}

int BridgeClient::port() const {
    std::lock_guard<std::mutex> lock(transport_mtx_);
    return server_ ? server_->port() : 0;
}

std::string BridgeClient::token() const {
    std::lock_guard<std::mutex> lock(transport_mtx_);
    return server_ ? server_->token() : std::string();
}

std::size_t BridgeClient::pending_count() {
    std::lock_guard<std::mutex> lock(mtx_);
    return pending_.size();
}

void BridgeClient::handle_incoming(const BridgeMessage& msg) {
    switch (msg.type()) {
        case MessageType::SessionResult: {
            SessionResult result = session_result_from(msg);
            std::unique_lock<std::mutex> lock(mtx_);
            auto it = pending_.find(result.plan_id);
            if (it == pending_.end()) {
                lock.unlock();
                log_.debug("Dropping result with no pending request", {{"planId", result.plan_id}});
                return;
            }
            std::promise<SessionResult> promise = std::move(it->second.promise);
            pending_.erase(it);
            lock.unlock();
            cv_.notify_all();
            log_.info("Session result received", {{"planId", result.plan_id}, {"passed", result.passed}});
            promise.set_value(std::move(result));
            return;
        }
        case MessageType::AgentReady:
            log_.info("Agent ready", msg.payload());
            return;
        case MessageType::StartSession:
        case MessageType::ControllerReady:
        case MessageType::ControllerError:
            log_.debug("Ignoring unexpected message", {{"type", to_string(msg.type())}});
            return;
    }
}

void BridgeClient::reaper_loop() {
    std::unique_lock<std::mutex> lock(mtx_);
    while (!stopping_) {
        if (pending_.empty()) {
            cv_.wait(lock, [this] { return stopping_ || !pending_.empty(); });
            continue;
        }

        auto earliest = std::chrono::steady_clock::time_point::max();
        for (const auto& kv : pending_) earliest = std::min(earliest, kv.second.deadline);
        if (cv_.wait_until(lock, earliest) == std::cv_status::no_timeout) continue;

        const auto now = std::chrono::steady_clock::now();
        std::vector<std::pair<std::string, Pending>> expired;
        for (auto it = pending_.begin(); it != pending_.end();) {
            if (it->second.deadline <= now) {
                expired.emplace_back(it->first, std::move(it->second));
                it = pending_.erase(it);
            } else {
                ++it;
            }
        }
        lock.unlock();
        for (auto& e : expired) {
            const std::string what = "Session timed out after " + std::to_string(e.second.timeout_ms) +
                                     "ms for plan: " + e.first;
            log_.warn(what);
            e.second.promise.set_exception(std::make_exception_ptr(RequestTimeoutError(what)));
        }
        lock.lock();
    }
}
