#include "../include/message.hpp"
#include "../include/util.hpp"
#include <cstdint>
#include <vector>

using json = nlohmann::json;

const char* to_string(MessageType type) {
    switch (type) {
        case MessageType::StartSession: return "start_session";
        case MessageType::SessionResult: return "session_result";
        case MessageType::ControllerReady: return "controller_ready";
        case MessageType::AgentReady: return "agent_ready";
        case MessageType::ControllerError: return "controller_error";
    }
    return "unknown";
}

std::optional<MessageType> message_type_from_string(const std::string& s) {
    static const MessageType all[] = {
        MessageType::StartSession, MessageType::SessionResult, MessageType::ControllerReady,
        MessageType::AgentReady, MessageType::ControllerError
    };
    for (MessageType t : all) {
        if (s == to_string(t)) return t;
    }
    return std::nullopt;
}

BridgeMessage::BridgeMessage(MessageType type, json payload, int64_t timestamp)
    : type_(type), payload_(std::move(payload)), timestamp_(timestamp) {}

BridgeMessage BridgeMessage::create(MessageType type, json payload) {
    return BridgeMessage(type, std::move(payload), now_ms());
}

json BridgeMessage::to_json() const {
    return json{{"type", to_string(type_)}, {"payload", payload_}, {"timestamp", timestamp_}};
}

std::string BridgeMessage::serialize() const {
    return to_json().dump();
}

bool BridgeMessage::operator==(const BridgeMessage& other) const {
    return type_ == other.type_ && timestamp_ == other.timestamp_ && payload_ == other.payload_;
}

namespace {
// Per-type payload requirements; empty string means the payload is acceptable.
std::string check_payload(MessageType type, const json& p) {
    auto need_string = [&](const char* key) -> std::string {
        auto it = p.find(key);
        if (it == p.end() || !it->is_string()) return std::string(key) + " (string)";
        return {};
    };
    switch (type) {
        case MessageType::StartSession:
            return need_string("planId");
        case MessageType::SessionResult: {
            std::string missing = need_string("planId");
            auto it = p.find("passed");
            if (it == p.end() || !it->is_boolean()) {
                missing += missing.empty() ? "passed (boolean)" : ", passed (boolean)";
            }
            return missing;
        }
        case MessageType::ControllerError: {
            std::string missing = need_string("message");
            return missing;
        }
        case MessageType::ControllerReady:
        case MessageType::AgentReady:
            return {};
    }
    return "unhandled type";
}
}

ValidationResult validate_message(const json& value) {
    ValidationResult r;
    if (value.is_null()) {
        r.error = "Message is null";
        return r;
    }
    if (value.is_string()) {
        return deserialize_message(value.get<std::string>());
    }
    if (!value.is_object()) {
        r.error = std::string("Expected object, got ") + value.type_name();
        return r;
    }

    std::vector<std::string> missing;
    auto type_it = value.find("type");
    auto ts_it = value.find("timestamp");
    auto payload_it = value.find("payload");
    if (type_it == value.end() || !type_it->is_string()) missing.push_back("type (string)");
    if (ts_it == value.end() || !ts_it->is_number_integer() ||
        (ts_it->is_number_unsigned() && ts_it->get<uint64_t>() > static_cast<uint64_t>(INT64_MAX))) {
        missing.push_back("timestamp (integer)");
    }
    if (payload_it == value.end() || !payload_it->is_object()) missing.push_back("payload (object)");
    if (!missing.empty()) {
        r.error = "Invalid message structure. Missing:";
        for (std::size_t i = 0; i < missing.size(); ++i) {
            r.error += (i ? ", " : " ") + missing[i];
        }
        return r;
    }

    auto type = message_type_from_string(type_it->get<std::string>());
    if (!type) {
        r.error = "Unknown message type: " + type_it->get<std::string>();
        return r;
    }
    std::string payload_err = check_payload(*type, *payload_it);
    if (!payload_err.empty()) {
        r.error = std::string("Invalid ") + to_string(*type) + " payload. Missing: " + payload_err;
        return r;
    }

    r.valid = true;
    r.message = BridgeMessage(*type, *payload_it, ts_it->get<int64_t>());
    return r;
}

ValidationResult deserialize_message(const std::string& text) {
    json parsed = json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        ValidationResult r;
        r.error = "Message is not valid JSON";
        return r;
    }
    if (parsed.is_string()) {
        ValidationResult r;
        r.error = "Expected object, got string";
        return r;
    }
    return validate_message(parsed);
}

SessionResult session_result_from(const BridgeMessage& msg) {
    const json& p = msg.payload();
    SessionResult r;
    r.plan_id = p.at("planId").get<std::string>();
    r.passed = p.at("passed").get<bool>();
    r.summary = p.value("summary", std::string());
    if (p.contains("duration") && p["duration"].is_number_integer()) r.duration_ms = p["duration"].get<int64_t>();
    r.payload = p;
    return r;
}

BridgeMessage make_session_result(const SessionResult& result) {
    json p = result.payload.is_object() ? result.payload : json::object();
    p["planId"] = result.plan_id;
    p["passed"] = result.passed;
    p["summary"] = result.summary;
    p["duration"] = result.duration_ms;
    return BridgeMessage::create(MessageType::SessionResult, std::move(p));
}

BridgeMessage make_start_session(const std::string& plan_id, const json& payload) {
    json p = payload.is_object() ? payload : json::object();
    if (!payload.is_object() && !payload.is_null()) p["plan"] = payload;
    p["planId"] = plan_id;
    return BridgeMessage::create(MessageType::StartSession, std::move(p));
}

std::optional<std::string> plan_id_of(const BridgeMessage& msg) {
    auto it = msg.payload().find("planId");
    if (it == msg.payload().end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}
