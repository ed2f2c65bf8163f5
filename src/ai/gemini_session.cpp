#include "voice_bridge/ai/gemini_session.hpp"

#include <chrono>
#include <functional>
#include <stdexcept>

#include <websocketpp/client.hpp>
#include <websocketpp/config/asio_client.hpp>

#include "voice_bridge/errors.hpp"
#include "voice_bridge/logging.hpp"
#include "voice_bridge/utils/http.hpp"

namespace voice_bridge {
namespace ai {

namespace detail {

// The websocketpp client for one session, erased over plain and TLS configs.
class LiveTransport {
public:
    struct Handlers {
        std::function<void()> on_open;
        std::function<void(const std::string&)> on_message;
        std::function<void(const std::string&, bool)> on_ended;
    };

    virtual ~LiveTransport() = default;

    virtual void connect(const std::string& url) = 0;
    virtual void run() = 0;
    virtual void send(const std::string& payload, websocketpp::lib::error_code& ec) = 0;
    virtual void close(websocketpp::lib::error_code& ec) = 0;
    virtual void stop() = 0;
};

}

namespace {

using TlsClient = websocketpp::client<websocketpp::config::asio_tls_client>;
using PlainClient = websocketpp::client<websocketpp::config::asio_client>;
using TlsContext = websocketpp::lib::asio::ssl::context;

constexpr const char* kLivePath =
    "/ws/google.ai.generativelanguage.v1beta.GenerativeService.BidiGenerateContent";

void configure_tls(TlsClient& client, const std::string& host) {
    client.set_tls_init_handler([host](websocketpp::connection_hdl) {
        auto context = websocketpp::lib::make_shared<TlsContext>(TlsContext::tlsv12_client);
        context->set_default_verify_paths();
        context->set_verify_mode(websocketpp::lib::asio::ssl::verify_peer);
        context->set_verify_callback(websocketpp::lib::asio::ssl::host_name_verification(host));
        return context;
    });
}

void configure_tls(PlainClient&, const std::string&) {}

template <typename Client>
class WsTransport : public detail::LiveTransport {
public:
    WsTransport(const std::string& tls_host, Handlers handlers)
        : handlers_(std::move(handlers)) {
        client_.clear_access_channels(websocketpp::log::alevel::all);
        client_.clear_error_channels(websocketpp::log::elevel::all);
        client_.init_asio();
        configure_tls(client_, tls_host);

        client_.set_open_handler([this](websocketpp::connection_hdl) { handlers_.on_open(); });
        client_.set_message_handler(
            [this](websocketpp::connection_hdl, typename Client::message_ptr msg) {
                handlers_.on_message(msg->get_payload());
            });
        client_.set_close_handler([this](websocketpp::connection_hdl hdl) {
            auto connection = client_.get_con_from_hdl(hdl);
            const auto code = connection->get_remote_close_code();
            handlers_.on_ended("closed by provider: " + std::to_string(code) + " " +
                                   connection->get_remote_close_reason(),
                               code != websocketpp::close::status::normal);
        });
        client_.set_fail_handler([this](websocketpp::connection_hdl hdl) {
            auto connection = client_.get_con_from_hdl(hdl);
            handlers_.on_ended("connection failed: " + connection->get_ec().message(), true);
        });
    }

    void connect(const std::string& url) override {
        websocketpp::lib::error_code ec;
        auto connection = client_.get_connection(url, ec);
        if (ec) {
            throw AIServiceError("Invalid AI session endpoint: " + ec.message());
        }
        connection_ = connection->get_handle();
        client_.connect(connection);
    }

    void run() override {
        client_.run();
    }

    void send(const std::string& payload, websocketpp::lib::error_code& ec) override {
        client_.send(connection_, payload, websocketpp::frame::opcode::text, ec);
    }

    void close(websocketpp::lib::error_code& ec) override {
        client_.close(connection_, websocketpp::close::status::normal, "session closed", ec);
    }

    void stop() override {
        client_.stop();
    }

private:
    Client client_;
    websocketpp::connection_hdl connection_;
    Handlers handlers_;
};

}

GeminiLiveSession::GeminiLiveSession(const Config& config, const AiSessionOptions& options)
    : config_(config),
      options_(options) {
    std::string tls_host;
    const auto url = make_url(tls_host);
    detail::LiveTransport::Handlers handlers{
        [this]() { handle_open(); },
        [this](const std::string& payload) { handle_message(payload); },
        [this](const std::string& reason, bool failure) { handle_ended(reason, failure); }};
    if (url.rfind("ws://", 0) == 0) {
        transport_ = std::make_unique<WsTransport<PlainClient>>(tls_host, std::move(handlers));
    } else {
        transport_ = std::make_unique<WsTransport<TlsClient>>(tls_host, std::move(handlers));
    }
    transport_->connect(url);

    worker_ = std::thread([this]() {
        try {
            transport_->run();
        } catch (const std::exception& ex) {
            handle_ended(std::string("transport error: ") + ex.what(), true);
            return;
        }
        handle_ended("connection finished", false);
    });

    std::unique_lock<std::mutex> lock(state_mutex_);
    const bool signalled = state_cv_.wait_for(
        lock, std::chrono::milliseconds(config_.ai_connect_timeout_ms),
        [this]() { return ready_ || ended_; });
    if (ready_) {
        lock.unlock();
        logging::debug("AI session ready", {kv("session", options_.label)});
        return;
    }
    const std::string reason = failure_ ? *failure_
                               : signalled ? "closed before setup completed"
                                           : "timed out waiting for setup";
    lock.unlock();
    shutdown();
    throw AIServiceError("AI session setup failed: " + reason);
}

GeminiLiveSession::~GeminiLiveSession() {
    shutdown();
}

void GeminiLiveSession::send_audio(const std::vector<int16_t>& pcm16k) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (ended_ || closing_) {
            throw AIServiceError(failure_.value_or("AI session is closed"));
        }
    }
    const auto payload = build_audio_message(pcm16k).dump();
    websocketpp::lib::error_code ec;
    transport_->send(payload, ec);
    if (ec) {
        throw AIServiceError("Failed to send audio: " + ec.message());
    }
}

std::optional<AiEvent> GeminiLiveSession::receive() {
    auto event = events_.pop();
    if (event) {
        return event;
    }
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (failure_ && !closing_) {
        throw AIServiceError(*failure_);
    }
    return std::nullopt;
}

void GeminiLiveSession::close() {
    if (closing_.exchange(true)) {
        return;
    }
    websocketpp::lib::error_code ec;
    transport_->close(ec);
    if (ec) {
        // Not open yet, or already gone: stop the event loop outright.
        transport_->stop();
    }
    events_.cancel();
    logging::debug("AI session closed", {kv("session", options_.label)});
}

void GeminiLiveSession::handle_open() {
    const auto setup = build_setup_message(config_.gemini_model, options_.system_instruction);
    websocketpp::lib::error_code ec;
    transport_->send(setup.dump(), ec);
    if (ec) {
        handle_ended("setup send failed: " + ec.message(), true);
    }
}

void GeminiLiveSession::handle_message(const std::string& payload) {
    std::vector<AiEvent> events;
    try {
        events = decode_server_message(nlohmann::json::parse(payload));
    } catch (const std::exception& ex) {
        logging::warn("Dropping undecodable AI message",
                      {kv("session", options_.label), kv("error", ex.what())});
        return;
    }
    for (auto& event : events) {
        if (const auto* other = std::get_if<OtherEvent>(&event)) {
            if (other->kind == "setup_complete") {
                {
                    std::lock_guard<std::mutex> lock(state_mutex_);
                    ready_ = true;
                }
                state_cv_.notify_all();
            }
        }
        events_.push(std::move(event));
    }
}

void GeminiLiveSession::handle_ended(const std::string& reason, bool failure) {
    bool report = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (ended_) {
            return;
        }
        ended_ = true;
        if (failure && !closing_) {
            failure_ = reason;
            report = true;
        }
    }
    state_cv_.notify_all();
    events_.close();
    if (report) {
        logging::error("AI session failed",
                       {kv("session", options_.label), kv("reason", reason)});
    }
}

void GeminiLiveSession::shutdown() {
    close();
    if (worker_.joinable()) {
        worker_.join();
    }
}

std::string GeminiLiveSession::make_url(std::string& tls_host) const {
    const auto base = config_.gemini_base_url ? *config_.gemini_base_url
                                              : "wss://" + config_.gemini_host;
    std::string scheme;
    std::string base_path;
    int port = 0;
    try {
        utils::parse_url(base, scheme, tls_host, port, base_path);
    } catch (const std::logic_error&) {
        throw AIServiceError("Invalid AI session endpoint: " + base);
    }
    while (!base_path.empty() && base_path.back() == '/') {
        base_path.pop_back();
    }
    return utils::build_url(scheme, tls_host, port, base_path + kLivePath) +
           "?key=" + utils::url_encode(config_.gemini_api_key);
}

GeminiSessionFactory::GeminiSessionFactory(const Config& config) : config_(config) {}

std::unique_ptr<AiSpeechSession> GeminiSessionFactory::open(const AiSessionOptions& options) {
    return std::make_unique<GeminiLiveSession>(config_, options);
}

}
}
