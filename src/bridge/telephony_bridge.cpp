#include "voice_bridge/bridge/telephony_bridge.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>

#include <nlohmann/json.hpp>

#include "voice_bridge/audio/transcoder.hpp"
#include "voice_bridge/bridge/duplex.hpp"
#include "voice_bridge/errors.hpp"
#include "voice_bridge/logging.hpp"
#include "voice_bridge/metrics.hpp"
#include "voice_bridge/session/identity.hpp"
#include "voice_bridge/session/recorder.hpp"
#include "voice_bridge/utils/crypto.hpp"
#include "voice_bridge/vad/barge_in.hpp"

namespace voice_bridge {
namespace bridge {

namespace {

constexpr const char* kChannel = "telephony";

struct StreamStart {
    std::string stream_sid;
    std::string call_sid;
    std::string from;
};

std::string string_at(const nlohmann::json& object, const char* key) {
    if (!object.is_object()) {
        return "";
    }
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

const nlohmann::json& object_at(const nlohmann::json& object, const char* key) {
    static const nlohmann::json empty = nlohmann::json::object();
    if (!object.is_object()) {
        return empty;
    }
    const auto it = object.find(key);
    if (it == object.end() || !it->is_object()) {
        return empty;
    }
    return *it;
}

nlohmann::json parse_frame(const std::string& frame) {
    try {
        auto event = nlohmann::json::parse(frame);
        if (!event.is_object()) {
            throw TransportError("Media frame is not a JSON object");
        }
        return event;
    } catch (const nlohmann::json::parse_error& ex) {
        throw TransportError(std::string("Invalid media frame: ") + ex.what());
    }
}

// Custom parameters carried by the stream override the top-level fields.
StreamStart parse_start(const nlohmann::json& event) {
    const auto& start = object_at(event, "start");
    const auto& custom = object_at(start, "customParameters");

    StreamStart result;
    result.stream_sid = string_at(event, "streamSid");
    if (result.stream_sid.empty()) {
        result.stream_sid = string_at(start, "streamSid");
    }
    result.call_sid = string_at(start, "callSid");
    if (const auto custom_sid = string_at(custom, "callSid"); !custom_sid.empty()) {
        result.call_sid = custom_sid;
    }
    result.from = string_at(custom, "from");
    return result;
}

std::optional<std::string> non_empty(const std::string& value) {
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

class TelephonyCall {
public:
    TelephonyCall(const Config& config,
                  ai::AiSessionFactory& ai_factory,
                  std::unique_ptr<persistence::VoiceStore> store,
                  vad::ClassifierFactory& classifiers,
                  MediaSocket& socket)
        : config_(config),
          ai_factory_(ai_factory),
          store_(std::move(store)),
          socket_(socket),
          recorder_(*store_, config.assistant_user_id),
          barge_in_(classifiers.create()) {}

    void run() {
        try {
            const auto start = wait_for_start();
            if (!start) {
                logging::info("Media stream ended before start");
                return;
            }
            begin_call(*start);
            run_duplex([this]() { inbound_loop(); },
                       [this]() { outbound_loop(); },
                       [this]() {
                           ai_->close();
                           socket_.interrupt();
                       });
        } catch (const TransportError& ex) {
            logging::warn("Media stream failed", {kv("call_sid", call_sid_), kv("error", ex.what())});
        } catch (const AIServiceError& ex) {
            logging::error("AI session failed", {kv("call_sid", call_sid_), kv("error", ex.what())});
        } catch (const std::exception& ex) {
            logging::error("Call failed", {kv("call_sid", call_sid_), kv("error", ex.what())});
        }
    }

    void finish() {
        if (ai_) {
            ai_->close();
            ai_.reset();
        }
        if (recorder_.started()) {
            recorder_.end();
            Metrics::instance().session_ended(kChannel);
        }
        recorder_.drain();
        socket_.close(1000, "call ended");
        logging::info("Call finished", {kv("call_sid", call_sid_)});
    }

private:
    std::optional<StreamStart> wait_for_start() {
        while (auto frame = socket_.receive()) {
            const auto event = parse_frame(*frame);
            const auto type = string_at(event, "event");
            if (type == "start") {
                return parse_start(event);
            }
            if (type == "stop") {
                return std::nullopt;
            }
            logging::trace("Ignoring event before start", {kv("event", type)});
        }
        return std::nullopt;
    }

    void begin_call(const StreamStart& start) {
        stream_sid_ = start.stream_sid;
        call_sid_ = start.call_sid;
        logging::info("Media stream started",
                      {kv("call_sid", call_sid_), kv("stream_sid", stream_sid_)});

        const auto phone = session::normalize_phone_e164(start.from);
        session::CallerIdentityResolver resolver(*store_);
        const auto identity = resolver.resolve(phone);

        persistence::VoiceSessionRecord record;
        record.channel = kChannel;
        record.user_id = identity.user_id;
        record.client_id = identity.client_id;
        record.call_sid = non_empty(start.call_sid);
        record.stream_sid = non_empty(start.stream_sid);
        record.from_phone = !phone.empty() ? non_empty(phone) : non_empty(start.from);
        session::ChatMirror mirror;
        mirror.customer_id = identity.user_id;
        recorder_.start(record, mirror);
        recorder_.append(session::Sender::System, "call_started");
        Metrics::instance().session_started(kChannel);

        ai_ = ai_factory_.open({config_.system_prompt, "telephony:" + call_sid_});
    }

    void inbound_loop() {
        while (auto frame = socket_.receive()) {
            const auto event = parse_frame(*frame);
            const auto type = string_at(event, "event");
            if (type == "media") {
                handle_media(event);
            } else if (type == "stop") {
                logging::info("Carrier stopped the stream", {kv("call_sid", call_sid_)});
                return;
            } else if (type == "start") {
                logging::warn("Ignoring repeated start event", {kv("call_sid", call_sid_)});
            } else if (type != "connected" && type != "mark") {
                logging::debug("Ignoring unknown media event", {kv("event", type)});
            }
        }
    }

    void handle_media(const nlohmann::json& event) {
        const auto payload = string_at(object_at(event, "media"), "payload");
        if (payload.empty()) {
            return;
        }
        std::string mulaw;
        try {
            mulaw = utils::base64_decode(payload);
        } catch (const std::invalid_argument& ex) {
            logging::warn("Dropping undecodable media payload", {kv("error", ex.what())});
            return;
        }
        const auto pcm16k = audio::mulaw8k_to_pcm16k(mulaw);
        if (barge_in_.process_chunk(pcm16k)) {
            send_clear();
        }
        ai_->send_audio(pcm16k);
    }

    void send_clear() {
        if (stream_sid_.empty()) {
            return;
        }
        const nlohmann::json clear{{"event", "clear"}, {"streamSid", stream_sid_}};
        // Bumped before taking the lock so a frame waiting on it is dropped.
        ++clear_generation_;
        {
            std::lock_guard<std::mutex> lock(send_mutex_);
            socket_.send_text(clear.dump());
        }
        Metrics::instance().barge_in(kChannel);
        logging::debug("Caller barged in, playback cleared", {kv("call_sid", call_sid_)});
    }

    void outbound_loop() {
        while (auto event = ai_->receive()) {
            if (const auto* input = std::get_if<ai::InputTranscript>(&*event)) {
                recorder_.append(session::Sender::Caller, input->text);
            } else if (const auto* output = std::get_if<ai::OutputTranscript>(&*event)) {
                recorder_.append(session::Sender::Ai, output->text);
            } else if (const auto* chunk = std::get_if<ai::AudioChunk>(&*event)) {
                forward_audio(*chunk);
            } else if (const auto* other = std::get_if<ai::OtherEvent>(&*event)) {
                if (other->kind == "go_away") {
                    logging::info("AI session is going away", {kv("call_sid", call_sid_)});
                }
            }
        }
    }

    // Frames still queued when the caller barges in are dropped.
    void forward_audio(const ai::AudioChunk& chunk) {
        if (stream_sid_.empty() || chunk.samples.empty()) {
            return;
        }
        const auto pcm16k = audio::to_pcm16k(chunk.samples, chunk.sample_rate);
        const auto frames = audio::split_mulaw_frames(audio::pcm16k_to_mulaw8k(pcm16k),
                                                      audio::kTelephonySampleRate);
        const auto generation = clear_generation_.load();
        for (const auto& frame : frames) {
            const nlohmann::json media{{"event", "media"},
                                       {"streamSid", stream_sid_},
                                       {"media", {{"payload", utils::base64_encode(frame)}}}};
            std::lock_guard<std::mutex> lock(send_mutex_);
            if (clear_generation_.load() != generation) {
                logging::trace("Dropping audio superseded by barge-in");
                return;
            }
            socket_.send_text(media.dump());
        }
    }

    const Config& config_;
    ai::AiSessionFactory& ai_factory_;
    std::unique_ptr<persistence::VoiceStore> store_;
    MediaSocket& socket_;
    session::SessionRecorder recorder_;
    vad::BargeInController barge_in_;
    std::unique_ptr<ai::AiSpeechSession> ai_;
    std::string stream_sid_;
    std::string call_sid_;
    std::mutex send_mutex_;
    std::atomic<uint64_t> clear_generation_{0};
};

}

TelephonyBridge::TelephonyBridge(const Config& config,
                                 ai::AiSessionFactory& ai_factory,
                                 persistence::VoiceStoreFactory& stores,
                                 vad::ClassifierFactory& classifiers)
    : config_(config),
      ai_factory_(ai_factory),
      stores_(stores),
      classifiers_(classifiers) {}

void TelephonyBridge::run(MediaSocket& socket) {
    TelephonyCall call(config_, ai_factory_, stores_.create(), classifiers_, socket);
    call.run();
    call.finish();
}

}
}
