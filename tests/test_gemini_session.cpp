#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "voice_bridge/ai/gemini_session.hpp"
#include "voice_bridge/errors.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>
#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

using nlohmann::json;
using voice_bridge::AIServiceError;
using voice_bridge::testing::wait_until;
namespace ai = voice_bridge::ai;

namespace {

using Server = websocketpp::server<websocketpp::config::asio>;

enum class Reply {
    SetupThenTranscript,
    Silent,
    SetupThenAbort
};

// Plain-ws stand-in for the Live endpoint, answering the setup message per reply.
class LoopbackProvider {
public:
    explicit LoopbackProvider(Reply reply) : reply_(reply) {
        server_.clear_access_channels(websocketpp::log::alevel::all);
        server_.clear_error_channels(websocketpp::log::elevel::all);
        server_.init_asio();
        server_.set_reuse_addr(true);
        server_.set_message_handler([this](websocketpp::connection_hdl hdl, Server::message_ptr msg) {
            on_message(hdl, msg->get_payload());
        });
        server_.listen(websocketpp::lib::asio::ip::tcp::v4(), 0);
        websocketpp::lib::asio::error_code ec;
        port_ = server_.get_local_endpoint(ec).port();
        server_.start_accept();
        thread_ = std::thread([this]() { server_.run(); });
    }

    ~LoopbackProvider() {
        websocketpp::lib::error_code ec;
        server_.stop_listening(ec);
        server_.stop();
        thread_.join();
    }

    std::string base_url() const {
        return "ws://127.0.0.1:" + std::to_string(port_);
    }

    std::vector<std::string> received() {
        std::lock_guard<std::mutex> lock(mutex_);
        return received_;
    }

    size_t audio_messages() {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t count = 0;
        for (const auto& payload : received_) {
            if (json::parse(payload).contains("realtimeInput")) {
                ++count;
            }
        }
        return count;
    }

private:
    void on_message(websocketpp::connection_hdl hdl, const std::string& payload) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            received_.push_back(payload);
        }
        if (!json::parse(payload).contains("setup") || reply_ == Reply::Silent) {
            return;
        }
        websocketpp::lib::error_code ec;
        server_.send(hdl, json{{"setupComplete", json::object()}}.dump(),
                     websocketpp::frame::opcode::text, ec);
        if (reply_ == Reply::SetupThenTranscript) {
            const json transcript{{"serverContent", {{"outputTranscription", {{"text", "hello caller"}}}}}};
            server_.send(hdl, transcript.dump(), websocketpp::frame::opcode::text, ec);
        } else {
            server_.close(hdl, websocketpp::close::status::internal_endpoint_error,
                          "provider failure", ec);
        }
    }

    Reply reply_;
    Server server_;
    uint16_t port_ = 0;
    std::thread thread_;
    std::mutex mutex_;
    std::vector<std::string> received_;
};

voice_bridge::Config config_for(const std::string& base_url, int timeout_ms = 2000) {
    voice_bridge::Config config;
    config.gemini_api_key = "test-key";
    config.gemini_base_url = base_url;
    config.ai_connect_timeout_ms = timeout_ms;
    return config;
}

const ai::AiSessionOptions kOptions{"Be brief.", "test"};

bool is_kind(const std::optional<ai::AiEvent>& event, const std::string& kind) {
    if (!event) {
        return false;
    }
    const auto* other = std::get_if<ai::OtherEvent>(&*event);
    return other && other->kind == kind;
}

}

TEST_CASE("session opens after setup and a local close ends the stream quietly") {
    LoopbackProvider provider(Reply::SetupThenTranscript);
    const auto config = config_for(provider.base_url());
    ai::GeminiLiveSession session(config, kOptions);

    const auto setup = json::parse(provider.received().at(0));
    REQUIRE(setup.at("setup").at("model") == "models/" + config.gemini_model);

    REQUIRE(is_kind(session.receive(), "setup_complete"));
    const auto transcript = session.receive();
    REQUIRE(transcript);
    const auto* output = std::get_if<ai::OutputTranscript>(&*transcript);
    REQUIRE(output);
    REQUIRE(output->text == "hello caller");

    session.send_audio(std::vector<int16_t>(320, 100));
    REQUIRE(wait_until([&]() { return provider.audio_messages() == 1; }));

    session.close();
    std::optional<ai::AiEvent> after_close;
    REQUIRE_NOTHROW(after_close = session.receive());
    REQUIRE_FALSE(after_close);
    REQUIRE_THROWS_AS(session.send_audio(std::vector<int16_t>(320, 100)), AIServiceError);
}

TEST_CASE("missing setup acknowledgement times out") {
    LoopbackProvider provider(Reply::Silent);
    const auto config = config_for(provider.base_url(), 300);
    REQUIRE_THROWS_AS(ai::GeminiLiveSession(config, kOptions), AIServiceError);
}

TEST_CASE("abnormal provider close surfaces from receive") {
    LoopbackProvider provider(Reply::SetupThenAbort);
    const auto config = config_for(provider.base_url());
    ai::GeminiLiveSession session(config, kOptions);

    auto drain = [&]() {
        while (session.receive()) {
        }
    };
    REQUIRE_THROWS_AS(drain(), AIServiceError);
}

TEST_CASE("unreachable endpoint fails to open") {
    const auto config = config_for("ws://127.0.0.1:1");
    REQUIRE_THROWS_AS(ai::GeminiLiveSession(config, kOptions), AIServiceError);
}
