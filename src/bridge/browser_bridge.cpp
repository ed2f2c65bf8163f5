#include "voice_bridge/bridge/browser_bridge.hpp"

#include <memory>
#include <optional>

#include <nlohmann/json.hpp>

#include "voice_bridge/audio/transcoder.hpp"
#include "voice_bridge/bridge/duplex.hpp"
#include "voice_bridge/errors.hpp"
#include "voice_bridge/logging.hpp"
#include "voice_bridge/metrics.hpp"
#include "voice_bridge/session/recorder.hpp"
#include "voice_bridge/utils/crypto.hpp"

namespace voice_bridge {
namespace bridge {

namespace {

constexpr const char* kChannel = "browser";
constexpr int kPolicyViolation = 1008;

struct StartRequest {
    std::string token;
    std::optional<std::string> conversation_id;
};

nlohmann::json parse_message(const std::string& frame) {
    try {
        auto message = nlohmann::json::parse(frame);
        if (!message.is_object()) {
            throw TransportError("Browser message is not a JSON object");
        }
        return message;
    } catch (const nlohmann::json::parse_error& ex) {
        throw TransportError(std::string("Invalid browser message: ") + ex.what());
    }
}

std::string string_at(const nlohmann::json& object, const char* key) {
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

void send_error(MediaSocket& socket, const std::string& message) {
    const nlohmann::json payload{{"type", "error"}, {"message", message}};
    try {
        socket.send_text(payload.dump());
    } catch (const TransportError& ex) {
        logging::debug("Could not deliver error to browser", {kv("error", ex.what())});
    }
}

class BrowserSession {
public:
    BrowserSession(const Config& config,
                   ai::AiSessionFactory& ai_factory,
                   persistence::VoiceStoreFactory& stores,
                   const auth::RealtimeTokenVerifier& verifier,
                   MediaSocket& socket)
        : config_(config),
          ai_factory_(ai_factory),
          stores_(stores),
          verifier_(verifier),
          socket_(socket) {}

    void run() {
        const auto start = read_start();
        if (!start) {
            return;
        }
        const auto user_id = authenticate(*start);
        if (!user_id) {
            return;
        }
        store_ = stores_.create();
        if (start->conversation_id && !authorize_conversation(*start->conversation_id, *user_id)) {
            return;
        }

        recorder_ = std::make_unique<session::SessionRecorder>(*store_, config_.assistant_user_id);
        persistence::VoiceSessionRecord record;
        record.channel = kChannel;
        record.user_id = *user_id;
        record.metadata = {{"conversation_id", start->conversation_id
                                                   ? nlohmann::json(*start->conversation_id)
                                                   : nlohmann::json(nullptr)}};
        session::ChatMirror mirror;
        mirror.conversation_id = start->conversation_id;
        recorder_->start(record, mirror);
        Metrics::instance().session_started(kChannel);
        user_id_ = *user_id;

        try {
            ai_ = ai_factory_.open({config_.system_prompt, "browser:" + user_id_});
            run_duplex([this]() { inbound_loop(); },
                       [this]() { outbound_loop(); },
                       [this]() {
                           ai_->close();
                           socket_.interrupt();
                       });
        } catch (const AIServiceError& ex) {
            logging::error("AI session failed", {kv("user_id", user_id_), kv("error", ex.what())});
            send_error(socket_, "Voice session failed");
        } catch (const TransportError& ex) {
            logging::warn("Browser socket failed", {kv("user_id", user_id_), kv("error", ex.what())});
        } catch (const std::exception& ex) {
            logging::error("Browser voice session failed",
                           {kv("user_id", user_id_), kv("error", ex.what())});
            send_error(socket_, "Voice session failed");
        }
    }

    void finish() {
        if (ai_) {
            ai_->close();
            ai_.reset();
        }
        if (recorder_) {
            recorder_->end();
            recorder_->drain();
            Metrics::instance().session_ended(kChannel);
        }
        socket_.close(close_code_, close_code_ == kPolicyViolation ? "rejected" : "session ended");
    }

private:
    void reject(const std::string& message) {
        close_code_ = kPolicyViolation;
        send_error(socket_, message);
    }

    std::optional<StartRequest> read_start() {
        const auto frame = socket_.receive();
        if (!frame) {
            return std::nullopt;
        }
        nlohmann::json message;
        try {
            message = parse_message(*frame);
        } catch (const TransportError& ex) {
            logging::warn("Rejected browser session", {kv("error", ex.what())});
            reject("Expected start message");
            return std::nullopt;
        }
        if (string_at(message, "type") != "start") {
            reject("Expected start message");
            return std::nullopt;
        }
        StartRequest start;
        start.token = string_at(message, "token");
        if (const auto conversation = string_at(message, "conversation_id"); !conversation.empty()) {
            start.conversation_id = conversation;
        }
        return start;
    }

    std::optional<std::string> authenticate(const StartRequest& start) {
        try {
            return verifier_.verify(start.token).user_id;
        } catch (const AuthenticationError& ex) {
            logging::warn("Rejected browser token", {kv("error", ex.what())});
            reject(ex.what());
        } catch (const ConfigurationError& ex) {
            logging::error("Browser voice is not configured", {kv("error", ex.what())});
            reject("Voice sessions are unavailable");
        }
        return std::nullopt;
    }

    bool authorize_conversation(const std::string& conversation_id, const std::string& user_id) {
        std::optional<std::string> owner;
        try {
            owner = store_->find_conversation_owner(conversation_id);
        } catch (const PersistenceError& ex) {
            logging::warn("Conversation lookup failed",
                          {kv("conversation_id", conversation_id), kv("error", ex.what())});
            reject("Failed to validate conversation");
            return false;
        }
        if (!owner) {
            reject("Conversation not found");
            return false;
        }
        if (*owner != user_id) {
            logging::warn("Conversation belongs to another user",
                          {kv("conversation_id", conversation_id), kv("user_id", user_id)});
            reject("Access denied");
            return false;
        }
        return true;
    }

    void inbound_loop() {
        while (auto frame = socket_.receive()) {
            const auto message = parse_message(*frame);
            const auto type = string_at(message, "type");
            if (type == "audio") {
                const auto data = string_at(message, "data");
                if (data.empty()) {
                    continue;
                }
                std::string bytes;
                try {
                    bytes = utils::base64_decode(data);
                } catch (const std::invalid_argument& ex) {
                    logging::warn("Dropping undecodable browser audio", {kv("error", ex.what())});
                    continue;
                }
                ai_->send_audio(audio::pcm16_from_bytes(bytes));
            } else if (type == "stop") {
                logging::info("Browser stopped the session", {kv("user_id", user_id_)});
                return;
            }
        }
    }

    void outbound_loop() {
        while (auto event = ai_->receive()) {
            if (const auto* input = std::get_if<ai::InputTranscript>(&*event)) {
                recorder_->append(session::Sender::Caller, input->text);
            } else if (const auto* output = std::get_if<ai::OutputTranscript>(&*event)) {
                recorder_->append(session::Sender::Ai, output->text);
            } else if (const auto* chunk = std::get_if<ai::AudioChunk>(&*event)) {
                if (chunk->samples.empty()) {
                    continue;
                }
                const auto pcm16k = audio::to_pcm16k(chunk->samples, chunk->sample_rate);
                const nlohmann::json message{
                    {"type", "audio"},
                    {"data", utils::base64_encode(audio::pcm16_to_bytes(pcm16k))},
                    {"rate", audio::kModelInputSampleRate}};
                socket_.send_text(message.dump());
            }
        }
    }

    const Config& config_;
    ai::AiSessionFactory& ai_factory_;
    persistence::VoiceStoreFactory& stores_;
    const auth::RealtimeTokenVerifier& verifier_;
    MediaSocket& socket_;
    std::unique_ptr<persistence::VoiceStore> store_;
    std::unique_ptr<session::SessionRecorder> recorder_;
    std::unique_ptr<ai::AiSpeechSession> ai_;
    std::string user_id_;
    int close_code_ = 1000;
};

}

BrowserBridge::BrowserBridge(const Config& config,
                             ai::AiSessionFactory& ai_factory,
                             persistence::VoiceStoreFactory& stores)
    : config_(config),
      ai_factory_(ai_factory),
      stores_(stores),
      verifier_(config.realtime_jwt_secret) {}

void BrowserBridge::run(MediaSocket& socket) {
    BrowserSession session(config_, ai_factory_, stores_, verifier_, socket);
    try {
        session.run();
    } catch (const TransportError& ex) {
        logging::warn("Browser socket failed", {kv("error", ex.what())});
    }
    session.finish();
}

}
}
