#pragma once
#include <stdexcept>
#include <string>

struct BridgeError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// No port in the bind range could be bound.
struct TransportUnavailable : BridgeError {
    using BridgeError::BridgeError;
};

struct NotConnectedError : BridgeError {
    NotConnectedError() : BridgeError("Not connected to agent. Call connect() first.") {}
};

struct RequestTimeoutError : BridgeError {
    using BridgeError::BridgeError;
};

struct DisconnectedError : BridgeError {
    DisconnectedError() : BridgeError("Client disconnected") {}
};

struct DuplicateRequestError : BridgeError {
    explicit DuplicateRequestError(const std::string& plan_id)
        : BridgeError("A request is already pending for plan: " + plan_id) {}
};

// Transport-level HTTP failure; status is 0 when no response was received.
struct HttpError : BridgeError {
    HttpError(const std::string& what, long status_code) : BridgeError(what), status(status_code) {}
    long status;
};

struct UnauthorizedError : HttpError {
    UnauthorizedError() : HttpError("Unauthorized", 401) {}
};
