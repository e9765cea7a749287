#include "../include/control_server.hpp"
#include "../../../shared/cpp/bridge_sdk/include/errors.hpp"
#include "../../../shared/cpp/bridge_sdk/include/log.hpp"
#include "../../../shared/cpp/bridge_sdk/include/util.hpp"
#include <arpa/inet.h>
#include <cstring>
#include <netinet/in.h>
#include <microhttpd.h>

using json = nlohmann::json;

#if MHD_VERSION >= 0x00097002
using MhdResult = enum MHD_Result;
#else
using MhdResult = int;
#endif

namespace {
const Logger log_("bridge");

constexpr std::size_t kMaxBodyBytes = 8 * 1024 * 1024;

struct ConnInfo {
    std::string method;
    std::string url;
    std::string body;
    bool too_large{false};
};

HttpReply json_reply(int status, const json& body) {
    return HttpReply{status, body.dump()};
}

HttpReply error_reply(int status, const std::string& error) {
    return json_reply(status, json{{"ok", false}, {"error", error}});
}

MhdResult send_response(struct MHD_Connection* conn, const HttpReply& reply) {
    struct MHD_Response* resp = MHD_create_response_from_buffer(reply.body.size(), (void*)reply.body.data(), MHD_RESPMEM_MUST_COPY);
    if (!resp) return MHD_NO;
    if (!reply.body.empty()) MHD_add_response_header(resp, MHD_HTTP_HEADER_CONTENT_TYPE, "application/json");
    MHD_add_response_header(resp, "Access-Control-Allow-Origin", "*");
    MHD_add_response_header(resp, "Access-Control-Allow-Headers", "Content-Type, X-Bridge-Token");
    MHD_add_response_header(resp, "Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    MhdResult ret = MHD_queue_response(conn, reply.status, resp);
    MHD_destroy_response(resp);
    return ret;
}

MhdResult handler(void* cls, struct MHD_Connection* connection, const char* url, const char* method,
                  const char* /*version*/, const char* upload_data, size_t* upload_data_size, void** con_cls) {
    auto* server = static_cast<ControlServer*>(cls);
    ConnInfo* ci = static_cast<ConnInfo*>(*con_cls);
    if (!ci) {
        ci = new ConnInfo{method, url, {}, false};
        *con_cls = ci;
        return MHD_YES;
    }

    if (*upload_data_size) {
        if (ci->body.size() + *upload_data_size > kMaxBodyBytes) ci->too_large = true;
        else ci->body.append(upload_data, *upload_data_size);
        *upload_data_size = 0;
        return MHD_YES;
    }

    if (ci->too_large) {
        return send_response(connection, error_reply(413, "Request body too large"));
    }

    const char* token = MHD_lookup_connection_value(connection, MHD_HEADER_KIND, ControlServer::kTokenHeader);
    HttpReply reply = server->handle_request(ci->method, ci->url, token ? token : "", ci->body);
    return send_response(connection, reply);
}

void request_completed(void* /*cls*/, struct MHD_Connection* /*connection*/, void** con_cls,
                       enum MHD_RequestTerminationCode /*toe*/) {
    delete static_cast<ConnInfo*>(*con_cls);
    *con_cls = nullptr;
}
}

std::optional<int> first_available_port(int start, int count, const std::function<bool(int)>& try_bind) {
    for (int i = 0; i < count; ++i) {
        if (try_bind(start + i)) return start + i;
    }
    return std::nullopt;
}

ControlServer::ControlServer(ControlServerOptions opts) : opts_(std::move(opts)), token_(gen_token()) {
    if (opts_.port_range <= 0) opts_.port_range = kDefaultPortRange;
}

ControlServer::~ControlServer() {
    stop();
}

std::string ControlServer::base_url() const {
    return "http://127.0.0.1:" + std::to_string(port_.load());
}

bool ControlServer::try_listen(int port) {
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

    daemon_ = MHD_start_daemon(MHD_USE_AUTO | MHD_USE_INTERNAL_POLLING_THREAD,
                               static_cast<uint16_t>(port), nullptr, nullptr,
                               &handler, this,
                               MHD_OPTION_SOCK_ADDR, (struct sockaddr*)&addr,
                               MHD_OPTION_NOTIFY_COMPLETED, &request_completed, nullptr,
                               MHD_OPTION_END);
    if (!daemon_) {
        log_.debug("Port " + std::to_string(port) + " in use, trying next");
        return false;
    }
    return true;
}

int ControlServer::start() {
    if (daemon_) return port_.load();

    const int first = opts_.preferred_port;
    const int last = first + opts_.port_range - 1;
    auto bound = first_available_port(first, opts_.port_range,
                                      [this](int p) { return is_valid_port(p) && try_listen(p); });
    if (!bound) {
        throw TransportUnavailable("Could not find an available port in range " +
                                   std::to_string(first) + "-" + std::to_string(last));
    }
    port_ = *bound;
    log_.info("Bridge server started on port " + std::to_string(*bound));
    return *bound;
}

void ControlServer::stop() {
    if (!daemon_) return;
    MHD_stop_daemon(daemon_);
    daemon_ = nullptr;
    queue_.clear();
    {
        std::lock_guard<std::mutex> lock(cb_mtx_);
        callbacks_.clear();
    }
    log_.info("Bridge server stopped", {{"port", port_.load()}});
    port_ = 0;
}

void ControlServer::enqueue(BridgeMessage msg) {
    log_.debug("Message enqueued", {{"type", to_string(msg.type())}});
    queue_.enqueue(std::move(msg));
}

void ControlServer::on_result(ResultCallback cb) {
    std::lock_guard<std::mutex> lock(cb_mtx_);
    callbacks_.push_back(std::move(cb));
}

HttpReply ControlServer::handle_request(const std::string& method, const std::string& path,
                                        const std::string& token, const std::string& body) {
    if (method == "OPTIONS") return HttpReply{MHD_HTTP_NO_CONTENT, ""};

    try {
        if (method == "GET" && path == "/health") return handle_health();

        const bool known = (method == "GET" && (path == "/poll" || path == "/config")) ||
                           (method == "POST" && (path == "/result" || path == "/enqueue" || path == "/config"));
        if (!known) return error_reply(MHD_HTTP_NOT_FOUND, "Not found");
        if (!authorized(token)) return error_reply(MHD_HTTP_UNAUTHORIZED, "Unauthorized");

        if (path == "/poll") return handle_poll();
        if (path == "/config") return method == "GET" ? handle_config() : handle_config_update(body);
        if (path == "/result") return handle_result(body);
        return handle_enqueue(body);
    } catch (const std::exception& e) {
        return error_reply(MHD_HTTP_BAD_REQUEST, e.what());
    }
}

HttpReply ControlServer::handle_health() const {
    json out = {
        {"ok", true},
        {"token", token_},
        {"port", port_.load()},
        {"version", kVersion},
        {"baseUrl", opts_.base_url.empty() ? json(nullptr) : json(opts_.base_url)}
    };
    return json_reply(MHD_HTTP_OK, out);
}

HttpReply ControlServer::handle_poll() {
    json messages = json::array();
    for (const auto& m : queue_.drain_all()) messages.push_back(m.to_json());
    if (!messages.empty()) log_.debug("Delivered messages", {{"count", messages.size()}});
    return json_reply(MHD_HTTP_OK, json{{"messages", messages}});
}

namespace {
// Accepts {"message": {...}} or a bare message.
ValidationResult unwrap_message(const std::string& body, std::string* error) {
    json parsed = json::parse(body, nullptr, false);
    if (parsed.is_discarded()) {
        *error = "Invalid JSON";
        return ValidationResult{};
    }
    const json& candidate = (parsed.is_object() && parsed.contains("message")) ? parsed["message"] : parsed;
    ValidationResult v = validate_message(candidate);
    if (!v.valid) *error = "Invalid message";
    return v;
}
}

HttpReply ControlServer::handle_result(const std::string& body) {
    std::string error;
    ValidationResult v = unwrap_message(body, &error);
    if (!v.valid) {
        log_.warn("Rejected result", {{"error", v.error.empty() ? error : v.error}});
        return json_reply(MHD_HTTP_BAD_REQUEST, json{{"ok", false}, {"error", error}, {"details", v.error}});
    }
    log_.debug("Result received", {{"type", to_string(v.message->type())}});

    std::vector<ResultCallback> cbs;
    {
        std::lock_guard<std::mutex> lock(cb_mtx_);
        cbs = callbacks_;
    }
    for (const auto& cb : cbs) {
        try {
            cb(*v.message);
        } catch (const std::exception& e) {
            log_.error("Result handler failed", {{"error", e.what()}});
        }
    }
    return json_reply(MHD_HTTP_OK, json{{"ok", true}});
}

HttpReply ControlServer::handle_enqueue(const std::string& body) {
    std::string error;
    ValidationResult v = unwrap_message(body, &error);
    if (!v.valid) {
        return json_reply(MHD_HTTP_BAD_REQUEST, json{{"ok", false}, {"error", error}, {"details", v.error}});
    }
    log_.info("Message enqueued via POST /enqueue", {{"type", to_string(v.message->type())}});
    enqueue(*v.message);
    return json_reply(MHD_HTTP_OK, json{{"ok", true}});
}

HttpReply ControlServer::handle_config() const {
    std::lock_guard<std::mutex> lock(config_mtx_);
    json cfg = opts_.config.is_object() ? opts_.config : json::object();
    return json_reply(MHD_HTTP_OK, json{{"ok", true}, {"config", cfg}});
}

HttpReply ControlServer::handle_config_update(const std::string& body) {
    json parsed = json::parse(body, nullptr, false);
    if (parsed.is_discarded()) return error_reply(MHD_HTTP_BAD_REQUEST, "Invalid JSON");
    if (!parsed.is_object() || !parsed.contains("config") || !parsed["config"].is_object()) {
        return error_reply(MHD_HTTP_BAD_REQUEST, "Missing config object");
    }

    std::lock_guard<std::mutex> lock(config_mtx_);
    if (!opts_.config_path.empty()) {
        try {
            write_text_file_atomic(opts_.config_path, parsed["config"].dump(2) + "\n");
        } catch (const std::exception& e) {
            log_.error("Failed to save config", {{"path", opts_.config_path.string()}, {"error", e.what()}});
            return error_reply(MHD_HTTP_INTERNAL_SERVER_ERROR, "Failed to save config");
        }
    }
    opts_.config = parsed["config"];
    log_.info("Config updated", {{"path", opts_.config_path.string()}});
    return json_reply(MHD_HTTP_OK, json{{"ok", true}});
}
