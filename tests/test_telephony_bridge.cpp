#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "voice_bridge/audio/transcoder.hpp"
#include "voice_bridge/bridge/telephony_bridge.hpp"
#include "voice_bridge/utils/crypto.hpp"

#include <atomic>
#include <chrono>
#include <cmath>
#include <optional>
#include <thread>

#include <nlohmann/json.hpp>

using nlohmann::json;
using voice_bridge::testing::EventLog;
using voice_bridge::testing::FakeAiFactory;
using voice_bridge::testing::FakeSocket;
using voice_bridge::testing::FakeStore;
using voice_bridge::testing::FakeStoreFactory;
using voice_bridge::testing::wait_until;
namespace audio = voice_bridge::audio;
namespace ai = voice_bridge::ai;

namespace {

std::string start_frame(const std::string& from = "+15551234567") {
    return json{{"event", "start"},
                {"streamSid", "MZ1"},
                {"start",
                 {{"streamSid", "MZ1"},
                  {"callSid", "CA-top"},
                  {"customParameters", {{"from", from}, {"callSid", "CA123"}}}}}}
        .dump();
}

std::string media_frame(const std::string& mulaw) {
    return json{{"event", "media"},
                {"streamSid", "MZ1"},
                {"media", {{"payload", voice_bridge::utils::base64_encode(mulaw)}}}}
        .dump();
}

std::string silent_mulaw() {
    return std::string(160, '\xFF');
}

std::string voiced_mulaw() {
    std::vector<int16_t> samples(160);
    for (size_t i = 0; i < samples.size(); ++i) {
        samples[i] = static_cast<int16_t>(
            std::lround(8000.0 * std::sin(2.0 * 3.14159265358979 * 200.0 * i / 8000.0)));
    }
    return audio::mulaw_encode(samples);
}

const std::string kStop = json{{"event", "stop"}, {"streamSid", "MZ1"}}.dump();

// Holds the first outbound media frame until a voiced caller frame has been
// read, so the barge-in lands while a long chunk is still being sent.
class GatedSocket : public FakeSocket {
public:
    std::optional<std::string> receive() override {
        auto frame = FakeSocket::receive();
        received_++;
        return frame;
    }

    void send_text(const std::string& payload) override {
        if (!gated_ && payload.find("\"media\"") != std::string::npos) {
            gated_ = true;
            const auto before = received_.load();
            push(media_frame(voiced_mulaw()));
            wait_until([&]() { return received_.load() > before; });
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        FakeSocket::send_text(payload);
    }

private:
    std::atomic<int> received_{0};
    bool gated_ = false;
};

struct Harness {
    voice_bridge::Config config;
    FakeStore store;
    FakeAiFactory ai;
    voice_bridge::vad::ClassifierFactory classifiers{config};
    FakeStoreFactory stores{store};
    voice_bridge::bridge::TelephonyBridge bridge{config, ai, stores, classifiers};
};

size_t count_events(const std::vector<std::string>& sent, const std::string& type) {
    size_t count = 0;
    for (const auto& frame : sent) {
        if (json::parse(frame).value("event", "") == type) {
            ++count;
        }
    }
    return count;
}

}

TEST_CASE("telephony happy path records one session and forwards audio") {
    Harness harness;
    harness.store.existing_client = voice_bridge::persistence::ClientAccount{"client-1", "user-1"};
    FakeSocket socket;
    socket.push(json{{"event", "connected"}}.dump());
    socket.push(start_frame());
    socket.push(media_frame(silent_mulaw()));
    socket.push(kStop);

    harness.bridge.run(socket);

    REQUIRE(harness.store.lookups == std::vector<std::string>{"+15551234567"});
    REQUIRE(harness.store.placeholders.empty());

    REQUIRE(harness.store.sessions.size() == 1);
    const auto& session = harness.store.sessions[0];
    REQUIRE(session.channel == "telephony");
    REQUIRE(session.call_sid == "CA123");
    REQUIRE(session.stream_sid == "MZ1");
    REQUIRE(session.from_phone == "+15551234567");
    REQUIRE(session.client_id == "client-1");
    REQUIRE(session.user_id == "user-1");
    REQUIRE(session.status == "active");

    REQUIRE(harness.store.messages.size() == 1);
    REQUIRE(harness.store.messages[0].sender == "system");
    REQUIRE(harness.store.messages[0].text == "call_started");

    REQUIRE(harness.ai.open_count() == 1);
    REQUIRE(harness.ai.state->audio_count() == 1);
    REQUIRE(harness.ai.state->sent_audio[0].size() == 320);
    REQUIRE(harness.ai.state->closes == 1);

    REQUIRE(harness.store.ended.size() == 1);
    REQUIRE(harness.store.ended[0].first == session.id);
    REQUIRE(socket.closed());
    REQUIRE(count_events(socket.sent(), "clear") == 0);
}

TEST_CASE("model output becomes transcript lines and framed media") {
    Harness harness;
    harness.store.existing_client = voice_bridge::persistence::ClientAccount{"client-1", "user-1"};
    harness.ai.state->events.push(ai::InputTranscript{"I need a quote"});
    harness.ai.state->events.push(ai::OutputTranscript{"Sure, one moment"});
    harness.ai.state->events.push(ai::AudioChunk{std::vector<int16_t>(960, 1000), 24000});

    FakeSocket socket;
    socket.push(start_frame());
    std::thread runner([&]() { harness.bridge.run(socket); });

    REQUIRE(wait_until([&]() { return count_events(socket.sent(), "media") >= 2; }));
    socket.push(kStop);
    runner.join();

    const auto sent = socket.sent();
    REQUIRE(count_events(sent, "media") == 2);
    const auto first = json::parse(sent[0]);
    REQUIRE(first.at("streamSid") == "MZ1");
    const auto payload = voice_bridge::utils::base64_decode(
        first.at("media").at("payload").get<std::string>());
    REQUIRE(payload.size() == 160);

    REQUIRE(harness.store.messages.size() == 3);
    REQUIRE(harness.store.messages[1].sender == "caller");
    REQUIRE(harness.store.messages[1].text == "I need a quote");
    REQUIRE(harness.store.messages[2].sender == "ai");
    REQUIRE(harness.store.chat_messages.size() == 2);
    REQUIRE(harness.store.chat_messages[0].sender_id == "user-1");
    REQUIRE(harness.store.chat_messages[1].sender_id == harness.config.assistant_user_id);
}

TEST_CASE("barge-in clears playback before further media") {
    Harness harness;
    EventLog log;
    harness.ai.state->log = &log;
    harness.ai.state->echo = ai::AudioChunk{std::vector<int16_t>(480, 1000), 24000};

    FakeSocket socket(&log);
    socket.push(start_frame());
    std::thread runner([&]() { harness.bridge.run(socket); });

    socket.push(media_frame(voiced_mulaw()));
    socket.push(media_frame(voiced_mulaw()));
    REQUIRE(wait_until([&]() { return count_events(socket.sent(), "media") >= 1; }));
    socket.push(kStop);
    runner.join();

    const auto entries = log.entries();
    size_t clear_at = entries.size();
    size_t first_audio_at = entries.size();
    size_t first_media_at = entries.size();
    for (size_t i = 0; i < entries.size(); ++i) {
        if (entries[i].find("\"clear\"") != std::string::npos && clear_at == entries.size()) {
            clear_at = i;
        }
        if (entries[i] == "ai:audio" && first_audio_at == entries.size()) {
            first_audio_at = i;
        }
        if (entries[i].find("\"media\"") != std::string::npos && first_media_at == entries.size()) {
            first_media_at = i;
        }
    }
    REQUIRE(clear_at < entries.size());
    REQUIRE(clear_at < first_audio_at);
    REQUIRE(clear_at < first_media_at);
    REQUIRE(count_events(socket.sent(), "clear") == 1);
    REQUIRE(harness.ai.state->audio_count() == 2);
}

TEST_CASE("barge-in during a long chunk drops the rest of that chunk") {
    Harness harness;
    // 200 ms of model audio, ten telephony frames.
    harness.ai.state->events.push(ai::AudioChunk{std::vector<int16_t>(4800, 1000), 24000});

    GatedSocket socket;
    socket.push(start_frame());
    std::thread runner([&]() { harness.bridge.run(socket); });

    REQUIRE(wait_until([&]() { return count_events(socket.sent(), "clear") == 1; }));
    socket.push(kStop);
    runner.join();

    const auto sent = socket.sent();
    size_t clear_at = sent.size();
    size_t media_before = 0;
    size_t media_after = 0;
    for (size_t i = 0; i < sent.size(); ++i) {
        const auto event = json::parse(sent[i]).value("event", "");
        if (event == "clear") {
            clear_at = i;
        } else if (event == "media") {
            if (clear_at == sent.size()) {
                ++media_before;
            } else {
                ++media_after;
            }
        }
    }
    REQUIRE(clear_at < sent.size());
    REQUIRE(count_events(sent, "clear") == 1);
    REQUIRE(media_before >= 1);
    REQUIRE(media_before < 10);
    REQUIRE(media_after == 0);
}

TEST_CASE("each new burst of speech clears once") {
    Harness harness;
    FakeSocket socket;
    socket.push(start_frame());
    socket.push(media_frame(voiced_mulaw()));
    socket.push(media_frame(silent_mulaw()));
    socket.push(media_frame(voiced_mulaw()));
    socket.push(media_frame(voiced_mulaw()));
    socket.push(kStop);

    harness.bridge.run(socket);

    REQUIRE(count_events(socket.sent(), "clear") == 2);
    REQUIRE(harness.ai.state->audio_count() == 4);
}

TEST_CASE("media before start is ignored and hang-up ends the call") {
    Harness harness;
    FakeSocket socket;
    socket.push(media_frame(silent_mulaw()));
    socket.push(json{{"event", "mark"}}.dump());
    socket.push(start_frame());
    socket.push(start_frame());
    socket.push(json{{"event", "dtmf"}}.dump());
    socket.push(media_frame(silent_mulaw()));
    socket.hang_up();

    harness.bridge.run(socket);

    REQUIRE(harness.store.sessions.size() == 1);
    REQUIRE(harness.ai.state->audio_count() == 1);
    REQUIRE(harness.store.ended.size() == 1);
}

TEST_CASE("each call gets its own store") {
    Harness harness;
    harness.store.existing_client = voice_bridge::persistence::ClientAccount{"client-1", "user-1"};
    FakeSocket first;
    first.push(start_frame());
    first.push(kStop);
    FakeSocket second;
    second.push(start_frame("+15557654321"));
    second.push(kStop);

    std::thread other([&]() { harness.bridge.run(second); });
    harness.bridge.run(first);
    other.join();

    REQUIRE(harness.stores.created() == 2);
    REQUIRE(harness.store.sessions.size() == 2);
    REQUIRE(harness.store.ended.size() == 2);
}

TEST_CASE("stream that stops before start creates nothing") {
    Harness harness;
    FakeSocket socket;
    socket.push(json{{"event", "connected"}}.dump());
    socket.push(kStop);

    harness.bridge.run(socket);

    REQUIRE(harness.store.total_calls() == 0);
    REQUIRE(harness.ai.open_count() == 0);
    REQUIRE(socket.closed());
}

TEST_CASE("invalid frame terminates the call and still ends the session") {
    Harness harness;
    FakeSocket socket;
    socket.push(start_frame());
    socket.push("{not json");

    harness.bridge.run(socket);

    REQUIRE(harness.store.sessions.size() == 1);
    REQUIRE(harness.store.ended.size() == 1);
    REQUIRE(harness.ai.state->closes == 1);
    REQUIRE(socket.closed());
}

TEST_CASE("AI failure ends only the call") {
    Harness harness;
    harness.ai.state->receive_error = "provider closed with 1011";
    harness.ai.state->events.close();
    FakeSocket socket;
    socket.push(start_frame());

    harness.bridge.run(socket);

    REQUIRE(socket.interrupts >= 1);
    REQUIRE(harness.store.ended.size() == 1);
    REQUIRE(socket.closed());
}

TEST_CASE("AI open failure still ends the recorded session") {
    Harness harness;
    harness.ai.state->fail_open = true;
    FakeSocket socket;
    socket.push(start_frame());

    harness.bridge.run(socket);

    REQUIRE(harness.store.sessions.size() == 1);
    REQUIRE(harness.store.ended.size() == 1);
    REQUIRE(socket.closed());
}

TEST_CASE("persistence outage does not interrupt audio") {
    Harness harness;
    harness.store.fail_lookup = true;
    harness.store.fail_placeholder = true;
    harness.store.fail_writes = true;
    FakeSocket socket;
    socket.push(start_frame());
    socket.push(media_frame(silent_mulaw()));
    socket.push(media_frame(silent_mulaw()));
    socket.push(kStop);

    harness.bridge.run(socket);

    REQUIRE(harness.ai.state->audio_count() == 2);
    REQUIRE(harness.store.sessions.empty());
}

TEST_CASE("unknown caller number falls back to the raw value") {
    Harness harness;
    FakeSocket socket;
    socket.push(start_frame("anonymous"));
    socket.push(kStop);

    harness.bridge.run(socket);

    REQUIRE(harness.store.lookups.empty());
    REQUIRE(harness.store.sessions.size() == 1);
    REQUIRE(harness.store.sessions[0].from_phone == "anonymous");
    REQUIRE_FALSE(harness.store.sessions[0].client_id);
}
