#include "voice_bridge/app.hpp"
#include "voice_bridge/config.hpp"
#include "voice_bridge/logging.hpp"

#include <chrono>
#include <csignal>
#include <thread>

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void handle_signal(int) {
    g_stop_requested = 1;
}

}

int main() {
    try {
        const auto config = voice_bridge::Config::load();
        config.validate();
        voice_bridge::logging::init(config);
        voice_bridge::info(
            "Starting voice-bridge",
            {voice_bridge::kv("http_port", config.http_port),
             voice_bridge::kv("ws_port", config.ws_port),
             voice_bridge::kv("model", config.gemini_model),
             voice_bridge::kv("signature_validation", config.twilio_validate_signature)});

        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);

        voice_bridge::App app(config);
        app.init();
        while (!g_stop_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        app.stop();
        voice_bridge::logging::shutdown();
    } catch (const std::exception& ex) {
        voice_bridge::error(
            "Startup failed",
            {voice_bridge::kv("error", ex.what())});
        return 1;
    }
    return 0;
}
