#include "voice_bridge/server/http_server.hpp"

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

#include "voice_bridge/errors.hpp"
#include "voice_bridge/logging.hpp"
#include "voice_bridge/metrics.hpp"

namespace voice_bridge {
namespace server {

HttpServer::HttpServer(const Config& config, const signaling::SignalingHandler& signaling)
    : config_(config),
      signaling_(signaling) {}

void HttpServer::start() {
    server_ = std::make_unique<httplib::Server>();

    server_->Get("/health", [](const httplib::Request&, httplib::Response& res) {
        nlohmann::json payload{{"ok", true}};
        res.set_content(payload.dump(), "application/json");
        logging::debug("Health check served");
    });

    server_->Get("/metrics", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(Metrics::instance().render_prometheus(),
                        "text/plain; version=0.0.4");
    });

    server_->Post("/twilio/voice", [this](const httplib::Request& req, httplib::Response& res) {
        const auto started = std::chrono::steady_clock::now();
        Metrics::instance().increment_webhook_request();
        handle_voice_webhook(req, res);
        const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started;
        Metrics::instance().observe_webhook_latency(elapsed.count());
    });

    // Port 0 asks the OS for a free port.
    if (config_.http_port == 0) {
        port_ = server_->bind_to_any_port("0.0.0.0");
    } else if (server_->bind_to_port("0.0.0.0", config_.http_port)) {
        port_ = config_.http_port;
    }
    if (port_ <= 0) {
        throw TransportError("HTTP server failed to bind port " +
                             std::to_string(config_.http_port));
    }

    server_thread_ = std::thread([this]() {
        logging::info("HTTP server listening", {kv("port", port_)});
        if (!server_->listen_after_bind()) {
            logging::error("HTTP server stopped listening", {kv("port", port_)});
        }
    });
}

int HttpServer::port() const {
    return port_;
}

void HttpServer::stop() {
    if (server_) {
        server_->stop();
    }
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

void HttpServer::handle_voice_webhook(const httplib::Request& request,
                                      httplib::Response& response) const {
    signaling::VoiceWebhook webhook;
    webhook.path = request.path;
    webhook.host = request.get_header_value("Host");
    // Form fields are already decoded by httplib; the first value of a repeated field wins.
    for (const auto& param : request.params) {
        webhook.form.emplace(param.first, param.second);
    }
    webhook.signature = request.get_header_value("X-Twilio-Signature");
    try {
        const auto twiml = signaling_.handle_voice_webhook(webhook);
        response.set_content(twiml, "application/xml");
    } catch (const AuthenticationError& ex) {
        response.status = 401;
        response.set_content(nlohmann::json{{"detail", ex.what()}}.dump(), "application/json");
    } catch (const ConfigurationError& ex) {
        logging::error("Voice webhook misconfigured", {kv("error", ex.what())});
        response.status = 500;
        response.set_content(nlohmann::json{{"detail", ex.what()}}.dump(), "application/json");
    }
}

}
}
