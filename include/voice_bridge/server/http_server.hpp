#pragma once

#include <memory>
#include <thread>

#include <httplib.h>

#include "voice_bridge/config.hpp"
#include "voice_bridge/signaling/handler.hpp"

namespace voice_bridge {
namespace server {

// Health, metrics and the inbound call webhook.
class HttpServer {
public:
    HttpServer(const Config& config, const signaling::SignalingHandler& signaling);

    // Binds before returning; throws TransportError when the port is taken.
    void start();
    void stop();
    int port() const;

private:
    void handle_voice_webhook(const httplib::Request& request, httplib::Response& response) const;

    const Config& config_;
    const signaling::SignalingHandler& signaling_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
    int port_ = 0;
};

}
}
