#include "voice_bridge/server/ws_server.hpp"

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "voice_bridge/errors.hpp"
#include "voice_bridge/logging.hpp"
#include "voice_bridge/signaling/handler.hpp"
#include "voice_bridge/utils/async.hpp"
#include "voice_bridge/utils/blocking_queue.hpp"

namespace voice_bridge {
namespace server {

namespace {

using Endpoint = websocketpp::server<websocketpp::config::asio>;

constexpr auto kShutdownNotice = std::chrono::seconds(5);

std::string resource_path(const std::string& resource) {
    const auto query = resource.find('?');
    return query == std::string::npos ? resource : resource.substr(0, query);
}

bool is_known_path(const std::string& path) {
    return path == signaling::kTelephonyMediaPath || path == kBrowserVoicePath;
}

class ConnectionSocket : public bridge::MediaSocket {
public:
    ConnectionSocket(Endpoint& endpoint, websocketpp::connection_hdl hdl)
        : endpoint_(endpoint),
          hdl_(std::move(hdl)) {}

    std::optional<std::string> receive() override {
        return inbox_.pop();
    }

    void send_text(const std::string& payload) override {
        std::lock_guard<std::mutex> lock(send_mutex_);
        if (closed_) {
            throw TransportError("socket is closed");
        }
        websocketpp::lib::error_code ec;
        endpoint_.send(hdl_, payload, websocketpp::frame::opcode::text, ec);
        if (ec) {
            throw TransportError("send failed: " + ec.message());
        }
    }

    void interrupt() override {
        inbox_.cancel();
    }

    void close(int code, const std::string& reason) override {
        std::lock_guard<std::mutex> lock(send_mutex_);
        inbox_.cancel();
        if (closed_) {
            return;
        }
        closed_ = true;
        websocketpp::lib::error_code ec;
        endpoint_.close(hdl_, static_cast<websocketpp::close::status::value>(code), reason, ec);
        if (ec) {
            logging::debug("Socket close failed", {kv("error", ec.message())});
        }
    }

    void deliver(std::string payload) {
        inbox_.push(std::move(payload));
    }

    // Frames already received stay readable.
    void peer_closed() {
        {
            std::lock_guard<std::mutex> lock(send_mutex_);
            closed_ = true;
        }
        inbox_.close();
    }

private:
    Endpoint& endpoint_;
    websocketpp::connection_hdl hdl_;
    utils::BlockingQueue<std::string> inbox_;
    std::mutex send_mutex_;
    bool closed_ = false;
};

}

struct WsServer::State {
    Endpoint endpoint;
    std::mutex mutex;
    std::condition_variable idle_cv;
    std::map<websocketpp::connection_hdl, std::shared_ptr<ConnectionSocket>,
             std::owner_less<websocketpp::connection_hdl>> sockets;
    int active_bridges = 0;
    bool stopping = false;
    utils::TaskGroup bridges;

    std::shared_ptr<ConnectionSocket> find(const websocketpp::connection_hdl& hdl) {
        std::lock_guard<std::mutex> lock(mutex);
        const auto it = sockets.find(hdl);
        return it == sockets.end() ? nullptr : it->second;
    }

    void release(const websocketpp::connection_hdl& hdl) {
        std::shared_ptr<ConnectionSocket> socket;
        {
            std::lock_guard<std::mutex> lock(mutex);
            const auto it = sockets.find(hdl);
            if (it == sockets.end()) {
                return;
            }
            socket = it->second;
            sockets.erase(it);
        }
        socket->peer_closed();
    }
};

WsServer::WsServer(const Config& config,
                   bridge::TelephonyBridge& telephony,
                   bridge::BrowserBridge& browser)
    : config_(config),
      telephony_(telephony),
      browser_(browser),
      state_(std::make_unique<State>()) {}

WsServer::~WsServer() {
    stop();
}

void WsServer::start() {
    auto& endpoint = state_->endpoint;
    endpoint.clear_access_channels(websocketpp::log::alevel::all);
    endpoint.clear_error_channels(websocketpp::log::elevel::all);
    endpoint.init_asio();
    endpoint.set_reuse_addr(true);

    endpoint.set_validate_handler([this](websocketpp::connection_hdl hdl) {
        auto connection = state_->endpoint.get_con_from_hdl(hdl);
        const auto path = resource_path(connection->get_resource());
        if (!is_known_path(path)) {
            logging::warn("Rejected socket for unknown path", {kv("path", path)});
            connection->set_status(websocketpp::http::status_code::not_found);
            return false;
        }
        return true;
    });

    endpoint.set_open_handler([this](websocketpp::connection_hdl hdl) {
        auto connection = state_->endpoint.get_con_from_hdl(hdl);
        const auto path = resource_path(connection->get_resource());
        auto socket = std::make_shared<ConnectionSocket>(state_->endpoint, hdl);
        bool accepted = false;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (!state_->stopping) {
                state_->sockets.emplace(hdl, socket);
                ++state_->active_bridges;
                accepted = true;
            }
        }
        if (!accepted) {
            socket->close(websocketpp::close::status::going_away, "server shutdown");
            return;
        }
        logging::debug("Socket opened", {kv("path", path)});

        state_->bridges.spawn(path, [this, socket, path]() {
            try {
                if (path == signaling::kTelephonyMediaPath) {
                    telephony_.run(*socket);
                } else {
                    browser_.run(*socket);
                }
            } catch (const std::exception& ex) {
                logging::error("Bridge terminated", {kv("path", path), kv("error", ex.what())});
            }
            {
                std::lock_guard<std::mutex> lock(state_->mutex);
                --state_->active_bridges;
            }
            state_->idle_cv.notify_all();
        });
    });

    endpoint.set_message_handler([this](websocketpp::connection_hdl hdl, Endpoint::message_ptr msg) {
        if (msg->get_opcode() != websocketpp::frame::opcode::text) {
            logging::debug("Ignoring non-text frame");
            return;
        }
        if (auto socket = state_->find(hdl)) {
            socket->deliver(msg->get_payload());
        }
    });

    endpoint.set_close_handler([this](websocketpp::connection_hdl hdl) {
        state_->release(hdl);
    });
    endpoint.set_fail_handler([this](websocketpp::connection_hdl hdl) {
        state_->release(hdl);
    });

    endpoint.listen(static_cast<uint16_t>(config_.ws_port));
    endpoint.start_accept();

    server_thread_ = std::thread([this]() {
        logging::info("WebSocket server listening", {kv("port", config_.ws_port)});
        try {
            state_->endpoint.run();
        } catch (const std::exception& ex) {
            logging::error("WebSocket server stopped", {kv("error", ex.what())});
        }
    });
}

void WsServer::stop() {
    if (!server_thread_.joinable()) {
        return;
    }
    websocketpp::lib::error_code ec;
    state_->endpoint.stop_listening(ec);
    if (ec) {
        logging::warn("Failed to stop listening", {kv("error", ec.message())});
    }

    std::map<websocketpp::connection_hdl, std::shared_ptr<ConnectionSocket>,
             std::owner_less<websocketpp::connection_hdl>> sockets;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->stopping = true;
        sockets = state_->sockets;
    }
    for (auto& entry : sockets) {
        entry.second->close(websocketpp::close::status::going_away, "server shutdown");
    }
    {
        // Bridges reference the collaborators owned by the caller, so none may
        // outlive this call.
        std::unique_lock<std::mutex> lock(state_->mutex);
        while (!state_->idle_cv.wait_for(lock, kShutdownNotice,
                                         [this]() { return state_->active_bridges == 0; })) {
            logging::warn("Waiting for bridges to finish",
                          {kv("count", state_->active_bridges)});
        }
    }
    state_->bridges.join_all();

    state_->endpoint.stop();
    server_thread_.join();
}

}
}
