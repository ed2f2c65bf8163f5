#include "voice_bridge/app.hpp"

#include <utility>

#include "voice_bridge/logging.hpp"

namespace voice_bridge {

App::App(Config config)
    : config_(std::move(config)),
      stores_(config_),
      ai_factory_(config_),
      signaling_(config_) {}

App::~App() {
    stop();
}

void App::init() {
    classifiers_ = std::make_unique<vad::ClassifierFactory>(config_);
    logging::info("Voice activity detection ready",
                  {kv("backend", config_.vad_backend),
                   kv("aggressiveness", config_.vad_aggressiveness)});

    telephony_ = std::make_unique<bridge::TelephonyBridge>(config_, ai_factory_, stores_,
                                                           *classifiers_);
    browser_ = std::make_unique<bridge::BrowserBridge>(config_, ai_factory_, stores_);

    http_server_ = std::make_unique<server::HttpServer>(config_, signaling_);
    ws_server_ = std::make_unique<server::WsServer>(config_, *telephony_, *browser_);
    http_server_->start();
    ws_server_->start();
}

void App::stop() {
    if (stopped_.exchange(true)) {
        return;
    }
    logging::info("Shutting down");
    if (http_server_) {
        http_server_->stop();
    }
    if (ws_server_) {
        ws_server_->stop();
    }
}

const Config& App::config() const {
    return config_;
}

}
