#pragma once

#include <stdexcept>
#include <string>

namespace voice_bridge {

class BridgeError : public std::runtime_error {
public:
    explicit BridgeError(const std::string& message) : std::runtime_error(message) {}
};

// Missing or invalid secret/endpoint. Raised before any session exists.
class ConfigurationError : public BridgeError {
public:
    explicit ConfigurationError(const std::string& message) : BridgeError(message) {}
};

// Bad webhook signature or bad/expired browser token.
class AuthenticationError : public BridgeError {
public:
    explicit AuthenticationError(const std::string& message) : BridgeError(message) {}
};

// Socket closed or protocol violation. Terminates only the owning session.
class TransportError : public BridgeError {
public:
    explicit TransportError(const std::string& message) : BridgeError(message) {}
};

// Upstream speech session failure. Terminates only the owning session.
class AIServiceError : public BridgeError {
public:
    explicit AIServiceError(const std::string& message) : BridgeError(message) {}
};

// Recorder/resolver failure. Always caught and logged at the call site.
class PersistenceError : public BridgeError {
public:
    explicit PersistenceError(const std::string& message) : BridgeError(message) {}
};

class PersistencePermissionError : public PersistenceError {
public:
    explicit PersistencePermissionError(const std::string& message)
        : PersistenceError(message) {}
};

}
