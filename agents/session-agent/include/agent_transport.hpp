#pragma once
#include "../../../shared/cpp/bridge_sdk/include/message.hpp"
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct HealthInfo {
    bool ok{false};
    std::string token;
    int port{0};
    std::string version;
    std::optional<std::string> base_url;
};

// Outbound HTTP calls the agent makes against a ControlServer.
class AgentTransport {
public:
    virtual ~AgentTransport() = default;

    // nullopt when nothing usable answers within timeout_ms.
    virtual std::optional<HealthInfo> health(int port, long timeout_ms) = 0;
    // Raw entries of the "messages" array. Throws UnauthorizedError on 401
    // and HttpError on any other failure.
    virtual std::vector<nlohmann::json> poll(int port, const std::string& token, long timeout_ms) = 0;
    // Throws UnauthorizedError / HttpError like poll().
    virtual void post_result(int port, const std::string& token, const BridgeMessage& msg, long timeout_ms) = 0;
};

// libcurl implementation talking to http://127.0.0.1:<port>.
class CurlAgentTransport : public AgentTransport {
public:
    explicit CurlAgentTransport(std::string host = "127.0.0.1");

    std::optional<HealthInfo> health(int port, long timeout_ms) override;
    std::vector<nlohmann::json> poll(int port, const std::string& token, long timeout_ms) override;
    void post_result(int port, const std::string& token, const BridgeMessage& msg, long timeout_ms) override;

private:
    std::string url(int port, const char* path) const;
    std::string host_;
};
