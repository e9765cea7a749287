#include "../include/agent_transport.hpp"
#include "../../../shared/cpp/bridge_sdk/include/errors.hpp"
#include "../../../shared/cpp/bridge_sdk/include/http.hpp"

using json = nlohmann::json;

namespace {
const char* kTokenHeader = "X-Bridge-Token: ";

void check_status(const HttpResponse& r, const char* what) {
    if (r.status == 401) throw UnauthorizedError();
    if (r.status < 200 || r.status >= 300) {
        throw HttpError(std::string(what) + " failed: status " + std::to_string(r.status), r.status);
    }
}
}

CurlAgentTransport::CurlAgentTransport(std::string host) : host_(std::move(host)) {}

std::string CurlAgentTransport::url(int port, const char* path) const {
    return "http://" + host_ + ":" + std::to_string(port) + path;
}

std::optional<HealthInfo> CurlAgentTransport::health(int port, long timeout_ms) {
    HttpResponse r;
    try {
        r = http_get(url(port, "/health"), {}, timeout_ms);
    } catch (const HttpError&) {
        return std::nullopt;
    }
    if (r.status != 200) return std::nullopt;
    json j = json::parse(r.body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;

    HealthInfo h;
    h.ok = j.value("ok", false);
    if (j.contains("token") && j["token"].is_string()) h.token = j["token"].get<std::string>();
    h.port = (j.contains("port") && j["port"].is_number_integer()) ? j["port"].get<int>() : port;
    h.version = j.contains("version") && j["version"].is_string() ? j["version"].get<std::string>() : std::string();
    if (j.contains("baseUrl") && j["baseUrl"].is_string()) h.base_url = j["baseUrl"].get<std::string>();
    return h;
}

std::vector<json> CurlAgentTransport::poll(int port, const std::string& token, long timeout_ms) {
    HttpResponse r = http_get(url(port, "/poll"), {kTokenHeader + token}, timeout_ms);
    check_status(r, "poll");
    json j = json::parse(r.body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) throw HttpError("poll returned malformed body", r.status);
    std::vector<json> out;
    auto it = j.find("messages");
    if (it == j.end() || !it->is_array()) return out;
    for (const auto& m : *it) out.push_back(m);
    return out;
}

void CurlAgentTransport::post_result(int port, const std::string& token, const BridgeMessage& msg, long timeout_ms) {
    json body = {{"message", msg.to_json()}};
    HttpResponse r = http_post_json(url(port, "/result"), body.dump(), {kTokenHeader + token}, timeout_ms);
    check_status(r, "result");
}
