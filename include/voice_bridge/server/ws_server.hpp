#pragma once

#include <memory>
#include <thread>

#include "voice_bridge/bridge/browser_bridge.hpp"
#include "voice_bridge/bridge/telephony_bridge.hpp"
#include "voice_bridge/config.hpp"

namespace voice_bridge {
namespace server {

constexpr const char* kBrowserVoicePath = "/ws/browser-voice";

// WebSocket endpoint for the carrier media stream and browser voice sessions.
// Every accepted connection runs its bridge on a dedicated thread; stop() closes
// every connection and returns only after each of those threads has been joined.
class WsServer {
public:
    WsServer(const Config& config,
             bridge::TelephonyBridge& telephony,
             bridge::BrowserBridge& browser);
    ~WsServer();

    WsServer(const WsServer&) = delete;
    WsServer& operator=(const WsServer&) = delete;

    void start();
    void stop();

private:
    struct State;

    const Config& config_;
    bridge::TelephonyBridge& telephony_;
    bridge::BrowserBridge& browser_;
    std::unique_ptr<State> state_;
    std::thread server_thread_;
};

}
}
