#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

enum class MessageType {
    StartSession,    // controller -> agent: run a session for a plan
    SessionResult,   // agent -> controller: outcome of a session
    ControllerReady, // controller handshake
    AgentReady,      // agent handshake
    ControllerError  // controller-side failure report
};

const char* to_string(MessageType type);
std::optional<MessageType> message_type_from_string(const std::string& s);

// Wire form: {"type": "...", "payload": {...}, "timestamp": <ms since epoch>}
class BridgeMessage {
public:
    BridgeMessage(MessageType type, nlohmann::json payload, int64_t timestamp);

    // Stamps the message with the current time.
    static BridgeMessage create(MessageType type, nlohmann::json payload);

    MessageType type() const { return type_; }
    const nlohmann::json& payload() const { return payload_; }
    int64_t timestamp() const { return timestamp_; }

    nlohmann::json to_json() const;
    std::string serialize() const;

    bool operator==(const BridgeMessage& other) const;
    bool operator!=(const BridgeMessage& other) const { return !(*this == other); }

private:
    MessageType type_;
    nlohmann::json payload_;
    int64_t timestamp_;
};

struct ValidationResult {
    bool valid{false};
    std::optional<BridgeMessage> message;
    std::string error;
};

ValidationResult validate_message(const nlohmann::json& value);
// Accepts raw JSON text; parse failures are reported as invalid, never thrown.
ValidationResult deserialize_message(const std::string& text);

struct SessionResult {
    std::string plan_id;
    bool passed{false};
    std::string summary;
    int64_t duration_ms{0};
    nlohmann::json payload; // full session_result payload as received
};

// Requires a validated session_result message.
SessionResult session_result_from(const BridgeMessage& msg);
BridgeMessage make_session_result(const SessionResult& result);

// planId is stored in the payload; a non-object payload is carried under "plan".
BridgeMessage make_start_session(const std::string& plan_id, const nlohmann::json& payload);
std::optional<std::string> plan_id_of(const BridgeMessage& msg);
