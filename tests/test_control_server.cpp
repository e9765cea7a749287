#include <gtest/gtest.h>

#include "test_helpers.hpp"
#include "../services/controller/include/control_server.hpp"
#include "../shared/cpp/bridge_sdk/include/http.hpp"
#include <atomic>
#include <curl/curl.h>

using json = nlohmann::json;

namespace {
ControlServerOptions options_at(int port, int range = 10) {
    ControlServerOptions o;
    o.preferred_port = port;
    o.port_range = range;
    return o;
}

std::string url(int port, const std::string& path) {
    return "http://127.0.0.1:" + std::to_string(port) + path;
}

HttpHeaders auth(const ControlServer& s) {
    return {std::string(ControlServer::kTokenHeader) + ": " + s.token()};
}

size_t collect_header(char* buffer, size_t size, size_t nitems, void* userdata) {
    static_cast<std::string*>(userdata)->append(buffer, size * nitems);
    return size * nitems;
}
}

TEST(FirstAvailablePort, WalksRangeInOrder)
{
    std::vector<int> tried;
    auto p = first_available_port(7890, 10, [&](int port) {
        tried.push_back(port);
        return port == 7893;
    });
    EXPECT_EQ(p, std::optional<int>(7893));
    EXPECT_EQ(tried, (std::vector<int>{7890, 7891, 7892, 7893}));

    tried.clear();
    EXPECT_FALSE(first_available_port(7890, 3, [&](int port) { tried.push_back(port); return false; }));
    EXPECT_EQ(tried.size(), 3u);
}

TEST(ControlServerRouting, HealthNeedsNoToken)
{
    ControlServerOptions o;
    o.base_url = "http://localhost:3000";
    ControlServer s(o);
    HttpReply r = s.handle_request("GET", "/health", "", "");
    EXPECT_EQ(r.status, 200);
    json body = json::parse(r.body);
    EXPECT_TRUE(body["ok"].get<bool>());
    EXPECT_EQ(body["token"], s.token());
    EXPECT_EQ(body["version"], ControlServer::kVersion);
    EXPECT_EQ(body["baseUrl"], "http://localhost:3000");
}

TEST(ControlServerRouting, HealthReportsNullBaseUrlWhenUnset)
{
    ControlServer s;
    json body = json::parse(s.handle_request("GET", "/health", "", "").body);
    EXPECT_TRUE(body["baseUrl"].is_null());
}

TEST(ControlServerRouting, ProtectedRoutesRejectMissingOrWrongToken)
{
    ControlServer s;
    s.enqueue(make_start_session("p", json::object()));
    EXPECT_EQ(s.handle_request("GET", "/poll", "", "").status, 401);
    EXPECT_EQ(s.handle_request("GET", "/poll", "wrong", "").status, 401);
    EXPECT_EQ(s.handle_request("GET", "/config", "", "").status, 401);
    EXPECT_EQ(s.handle_request("POST", "/result", "wrong", "{}").status, 401);
    EXPECT_EQ(s.handle_request("POST", "/enqueue", "", "{}").status, 401);
    EXPECT_EQ(s.handle_request("POST", "/config", "wrong", R"({"config":{}})").status, 401);
    EXPECT_EQ(s.queued(), 1u);
}

TEST(ControlServerRouting, UnknownRoutesAre404)
{
    ControlServer s;
    HttpReply r = s.handle_request("GET", "/nope", s.token(), "");
    EXPECT_EQ(r.status, 404);
    EXPECT_EQ(json::parse(r.body)["error"], "Not found");
    EXPECT_EQ(s.handle_request("POST", "/poll", s.token(), "").status, 404);
}

TEST(ControlServerRouting, OptionsIsNoContent)
{
    ControlServer s;
    HttpReply r = s.handle_request("OPTIONS", "/poll", "", "");
    EXPECT_EQ(r.status, 204);
    EXPECT_TRUE(r.body.empty());
}

TEST(ControlServerRouting, PollDrainsInOrder)
{
    ControlServer s;
    s.enqueue(make_start_session("first", json::object()));
    s.enqueue(make_start_session("second", json::object()));

    json body = json::parse(s.handle_request("GET", "/poll", s.token(), "").body);
    ASSERT_EQ(body["messages"].size(), 2u);
    EXPECT_EQ(body["messages"][0]["payload"]["planId"], "first");
    EXPECT_EQ(body["messages"][1]["payload"]["planId"], "second");

    body = json::parse(s.handle_request("GET", "/poll", s.token(), "").body);
    EXPECT_TRUE(body["messages"].empty());
}

TEST(ControlServerRouting, ResultAcceptsWrappedAndBareMessages)
{
    ControlServer s;
    std::vector<std::string> plans;
    s.on_result([&](const BridgeMessage& m) { plans.push_back(*plan_id_of(m)); });

    SessionResult r;
    r.plan_id = "wrapped";
    r.passed = true;
    HttpReply reply = s.handle_request("POST", "/result", s.token(),
                                       json{{"message", make_session_result(r).to_json()}}.dump());
    EXPECT_EQ(reply.status, 200);
    EXPECT_TRUE(json::parse(reply.body)["ok"].get<bool>());

    r.plan_id = "bare";
    EXPECT_EQ(s.handle_request("POST", "/result", s.token(), make_session_result(r).serialize()).status, 200);
    EXPECT_EQ(plans, (std::vector<std::string>{"wrapped", "bare"}));
}

TEST(ControlServerRouting, ResultRejectsInvalidBodies)
{
    ControlServer s;
    int calls = 0;
    s.on_result([&](const BridgeMessage&) { ++calls; });

    HttpReply bad_json = s.handle_request("POST", "/result", s.token(), "{ nope");
    EXPECT_EQ(bad_json.status, 400);
    EXPECT_EQ(json::parse(bad_json.body)["error"], "Invalid JSON");

    HttpReply bad_msg = s.handle_request("POST", "/result", s.token(),
                                         R"({"message":{"type":"session_result","payload":{},"timestamp":1}})");
    EXPECT_EQ(bad_msg.status, 400);
    json body = json::parse(bad_msg.body);
    EXPECT_EQ(body["error"], "Invalid message");
    EXPECT_NE(body["details"].get<std::string>().find("planId"), std::string::npos);
    EXPECT_EQ(calls, 0);
}

TEST(ControlServerRouting, FailingSubscriberStillAcknowledges)
{
    ControlServer s;
    int later = 0;
    s.on_result([](const BridgeMessage&) { throw std::runtime_error("boom"); });
    s.on_result([&](const BridgeMessage&) { ++later; });
    auto msg = BridgeMessage::create(MessageType::AgentReady, json::object());
    EXPECT_EQ(s.handle_request("POST", "/result", s.token(), msg.serialize()).status, 200);
    EXPECT_EQ(later, 1);
}

TEST(ControlServerRouting, EnqueueAndConfig)
{
    ControlServerOptions o;
    o.config = json{{"watchDir", "web"}};
    ControlServer s(o);
    EXPECT_EQ(s.handle_request("POST", "/enqueue", s.token(),
                               json{{"message", make_start_session("e", json::object()).to_json()}}.dump()).status, 200);
    EXPECT_EQ(s.queued(), 1u);
    EXPECT_EQ(s.handle_request("POST", "/enqueue", s.token(), "[]").status, 400);

    json cfg = json::parse(s.handle_request("GET", "/config", s.token(), "").body);
    EXPECT_TRUE(cfg["ok"].get<bool>());
    EXPECT_EQ(cfg["config"]["watchDir"], "web");
}

TEST(ControlServerRouting, ConfigUpdateIsSavedAndServed)
{
    TempDir dir("config");
    ControlServerOptions o;
    o.config = json{{"watchDir", "web"}};
    o.config_path = dir.path / "bridge.config.json";
    ControlServer s(o);

    const std::string update = json{{"config", {{"watchDir", "app"}, {"timeoutMs", 500}}}}.dump();
    EXPECT_EQ(s.handle_request("POST", "/config", "", update).status, 401);
    EXPECT_FALSE(std::filesystem::exists(o.config_path));

    HttpReply bad_json = s.handle_request("POST", "/config", s.token(), "{ nope");
    EXPECT_EQ(bad_json.status, 400);
    EXPECT_EQ(json::parse(bad_json.body)["error"], "Invalid JSON");
    HttpReply no_config = s.handle_request("POST", "/config", s.token(), R"({"watchDir":"app"})");
    EXPECT_EQ(no_config.status, 400);
    EXPECT_EQ(json::parse(no_config.body)["error"], "Missing config object");
    EXPECT_EQ(s.handle_request("POST", "/config", s.token(), R"({"config":[1]})").status, 400);

    HttpReply ok = s.handle_request("POST", "/config", s.token(), update);
    EXPECT_EQ(ok.status, 200);
    EXPECT_TRUE(json::parse(ok.body)["ok"].get<bool>());

    json saved = json::parse(read_text_file(o.config_path));
    EXPECT_EQ(saved["watchDir"], "app");
    EXPECT_EQ(saved["timeoutMs"], 500);
    EXPECT_FALSE(std::filesystem::exists(dir.path / "bridge.config.json.tmp"));

    json served = json::parse(s.handle_request("GET", "/config", s.token(), "").body);
    EXPECT_EQ(served["config"]["watchDir"], "app");
}

TEST(ControlServerRouting, UnsavableConfigKeepsPreviousValue)
{
    TempDir dir("config-ro");
    write_text_file_atomic(dir.path / "blocker", "not a directory");
    ControlServerOptions o;
    o.config = json{{"watchDir", "web"}};
    o.config_path = dir.path / "blocker" / "bridge.config.json";
    ControlServer s(o);

    HttpReply r = s.handle_request("POST", "/config", s.token(), R"({"config":{"watchDir":"app"}})");
    EXPECT_EQ(r.status, 500);
    EXPECT_EQ(json::parse(r.body)["error"], "Failed to save config");
    json served = json::parse(s.handle_request("GET", "/config", s.token(), "").body);
    EXPECT_EQ(served["config"]["watchDir"], "web");
}

TEST(ControlServerSocket, ServesHealthAndPollOnLoopback)
{
    ControlServer s(options_at(41010));
    int port = s.start();
    EXPECT_EQ(port, 41010);
    EXPECT_TRUE(s.running());
    EXPECT_EQ(s.base_url(), "http://127.0.0.1:41010");

    HttpResponse h = http_get(url(port, "/health"));
    EXPECT_EQ(h.status, 200);
    json body = json::parse(h.body);
    EXPECT_EQ(body["token"], s.token());
    EXPECT_EQ(body["port"], port);

    s.enqueue(make_start_session("over-http", json::object()));
    EXPECT_EQ(http_get(url(port, "/poll")).status, 401);
    HttpResponse p = http_get(url(port, "/poll"), auth(s));
    EXPECT_EQ(p.status, 200);
    EXPECT_EQ(json::parse(p.body)["messages"][0]["payload"]["planId"], "over-http");
}

TEST(ControlServerSocket, PostedResultReachesSubscriber)
{
    ControlServer s(options_at(41020));
    int port = s.start();
    std::atomic<int> calls{0};
    s.on_result([&](const BridgeMessage& m) {
        if (m.type() == MessageType::SessionResult) ++calls;
    });
    SessionResult r;
    r.plan_id = "posted";
    r.passed = true;
    HttpResponse resp = http_post_json(url(port, "/result"),
                                       json{{"message", make_session_result(r).to_json()}}.dump(), auth(s));
    EXPECT_EQ(resp.status, 200);
    EXPECT_EQ(calls.load(), 1);
}

TEST(ControlServerSocket, TakenPortMovesToNext)
{
    ControlServer first(options_at(41030));
    ControlServer second(options_at(41030));
    EXPECT_EQ(first.start(), 41030);
    EXPECT_EQ(second.start(), 41031);
    EXPECT_NE(first.token(), second.token());
}

TEST(ControlServerSocket, ExhaustedRangeThrows)
{
    ControlServer a(options_at(41040, 2));
    ControlServer b(options_at(41040, 2));
    ControlServer c(options_at(41040, 2));
    a.start();
    b.start();
    try {
        c.start();
        FAIL() << "expected TransportUnavailable";
    } catch (const TransportUnavailable& e) {
        EXPECT_NE(std::string(e.what()).find("41040-41041"), std::string::npos);
    }
    EXPECT_FALSE(c.running());
}

TEST(ControlServerSocket, OutOfRangePortsAreNeverBound)
{
    ControlServer negative(options_at(-5, 3));
    EXPECT_THROW(negative.start(), TransportUnavailable);
    EXPECT_FALSE(negative.running());

    ControlServer overflow(options_at(65536, 4));
    EXPECT_THROW(overflow.start(), TransportUnavailable);
    EXPECT_EQ(overflow.port(), 0);
}

TEST(ValidPort, AcceptsOnlyBindablePorts)
{
    EXPECT_FALSE(is_valid_port(0));
    EXPECT_FALSE(is_valid_port(-1));
    EXPECT_FALSE(is_valid_port(65536));
    EXPECT_TRUE(is_valid_port(1));
    EXPECT_TRUE(is_valid_port(65535));
}

TEST(ControlServerSocket, StopReleasesPortAndIsIdempotent)
{
    ControlServer s(options_at(41050, 1));
    int port = s.start();
    s.enqueue(make_start_session("dropped", json::object()));
    s.stop();
    s.stop();
    EXPECT_FALSE(s.running());
    EXPECT_EQ(s.port(), 0);
    EXPECT_EQ(s.queued(), 0u);
    EXPECT_THROW(http_get(url(port, "/health"), {}, 500), HttpError);

    ControlServer again(options_at(41050, 1));
    EXPECT_EQ(again.start(), port);
}

TEST(ControlServerSocket, PreflightCarriesCorsHeaders)
{
    ControlServer s(options_at(41060));
    int port = s.start();

    CURL* curl = curl_easy_init();
    ASSERT_NE(curl, nullptr);
    std::string headers;
    std::string target = url(port, "/poll");
    curl_easy_setopt(curl, CURLOPT_URL, target.c_str());
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "OPTIONS");
    curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl, CURLOPT_NOPROXY, "*");
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, 2000L);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, collect_header);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &headers);
    CURLcode rc = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_easy_cleanup(curl);

    ASSERT_EQ(rc, CURLE_OK);
    EXPECT_EQ(status, 204);
    EXPECT_NE(headers.find("Access-Control-Allow-Origin: *"), std::string::npos);
    EXPECT_NE(headers.find("X-Bridge-Token"), std::string::npos);
}
