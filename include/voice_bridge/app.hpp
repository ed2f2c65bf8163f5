#pragma once

#include <atomic>
#include <memory>

#include "voice_bridge/ai/gemini_session.hpp"
#include "voice_bridge/bridge/browser_bridge.hpp"
#include "voice_bridge/bridge/telephony_bridge.hpp"
#include "voice_bridge/config.hpp"
#include "voice_bridge/persistence/supabase_store.hpp"
#include "voice_bridge/server/http_server.hpp"
#include "voice_bridge/server/ws_server.hpp"
#include "voice_bridge/signaling/handler.hpp"
#include "voice_bridge/vad/classifier.hpp"

namespace voice_bridge {

class App {
public:
    explicit App(Config config);
    ~App();

    // Starts both servers; they run on their own threads until stop().
    void init();
    void stop();
    const Config& config() const;

private:
    Config config_;
    persistence::SupabaseStoreFactory stores_;
    ai::GeminiSessionFactory ai_factory_;
    std::unique_ptr<vad::ClassifierFactory> classifiers_;
    signaling::SignalingHandler signaling_;
    std::unique_ptr<bridge::TelephonyBridge> telephony_;
    std::unique_ptr<bridge::BrowserBridge> browser_;
    std::unique_ptr<server::HttpServer> http_server_;
    std::unique_ptr<server::WsServer> ws_server_;
    std::atomic<bool> stopped_{false};
};

}
