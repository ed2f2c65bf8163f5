#include <catch2/catch_test_macros.hpp>

#include "voice_bridge/ai/protocol.hpp"
#include "voice_bridge/audio/transcoder.hpp"
#include "voice_bridge/utils/crypto.hpp"

#include <variant>

namespace ai = voice_bridge::ai;
using nlohmann::json;

TEST_CASE("setup message enables transcription and activity interrupts") {
    const auto message = ai::build_setup_message("gemini-live-test", "Be brief.");
    const auto& setup = message.at("setup");
    REQUIRE(setup.at("model") == "models/gemini-live-test");
    REQUIRE(setup.at("generationConfig").at("responseModalities") == json::array({"AUDIO", "TEXT"}));
    REQUIRE(setup.at("systemInstruction").at("parts").at(0).at("text") == "Be brief.");
    REQUIRE(setup.at("inputAudioTranscription").is_object());
    REQUIRE(setup.at("outputAudioTranscription").is_object());
    REQUIRE(setup.at("realtimeInputConfig").at("activityHandling") ==
            "START_OF_ACTIVITY_INTERRUPTS");

    const auto prefixed = ai::build_setup_message("models/already", "");
    REQUIRE(prefixed.at("setup").at("model") == "models/already");
}

TEST_CASE("audio message carries base64 pcm at 16k") {
    const std::vector<int16_t> samples{1, 2, 3};
    const auto message = ai::build_audio_message(samples);
    const auto& audio = message.at("realtimeInput").at("audio");
    REQUIRE(audio.at("mimeType") == "audio/pcm;rate=16000");
    const auto bytes = voice_bridge::utils::base64_decode(audio.at("data").get<std::string>());
    REQUIRE(voice_bridge::audio::pcm16_from_bytes(bytes) == samples);
}

TEST_CASE("pcm rate comes from the mime type") {
    REQUIRE(ai::parse_pcm_rate("audio/pcm;rate=16000") == 16000);
    REQUIRE(ai::parse_pcm_rate("audio/pcm; rate=24000") == 24000);
    REQUIRE(ai::parse_pcm_rate("audio/pcm") == 24000);
    REQUIRE(ai::parse_pcm_rate("audio/pcm;rate=") == 24000);
}

TEST_CASE("oversized pcm rate falls back to the default") {
    REQUIRE(ai::parse_pcm_rate("audio/pcm;rate=99999999999") == 24000);
    REQUIRE(ai::parse_pcm_rate("audio/pcm;rate=1234567") == 24000);
    REQUIRE(ai::parse_pcm_rate("audio/pcm;rate=192000") == 192000);
}

TEST_CASE("server content decodes into ordered events") {
    const std::vector<int16_t> samples(480, 7);
    const auto data = voice_bridge::utils::base64_encode(voice_bridge::audio::pcm16_to_bytes(samples));
    const json message = {
        {"serverContent",
         {{"inputTranscription", {{"text", "hello"}}},
          {"outputTranscription", {{"text", "hi there"}}},
          {"modelTurn",
           {{"parts", json::array({json{{"inlineData", {{"mimeType", "audio/pcm;rate=24000"},
                                                        {"data", data}}}},
                                   json{{"text", "ignored"}}})}}},
          {"turnComplete", true}}}};

    const auto events = ai::decode_server_message(message);
    REQUIRE(events.size() == 4);
    REQUIRE(std::get<ai::InputTranscript>(events[0]).text == "hello");
    REQUIRE(std::get<ai::OutputTranscript>(events[1]).text == "hi there");
    const auto& chunk = std::get<ai::AudioChunk>(events[2]);
    REQUIRE(chunk.sample_rate == 24000);
    REQUIRE(chunk.samples == samples);
    REQUIRE(std::get<ai::OtherEvent>(events[3]).kind == "turn_complete");
}

TEST_CASE("control messages decode to other events") {
    auto events = ai::decode_server_message(json{{"setupComplete", json::object()}});
    REQUIRE(events.size() == 1);
    REQUIRE(std::get<ai::OtherEvent>(events[0]).kind == "setup_complete");

    events = ai::decode_server_message(json{{"serverContent", {{"interrupted", true}}}});
    REQUIRE(std::get<ai::OtherEvent>(events.at(0)).kind == "interrupted");

    events = ai::decode_server_message(json{{"goAway", {{"timeLeft", "5s"}}}});
    REQUIRE(std::get<ai::OtherEvent>(events.at(0)).kind == "go_away");

    events = ai::decode_server_message(json{{"usageMetadata", json::object()}});
    REQUIRE(std::get<ai::OtherEvent>(events.at(0)).kind == "unknown");

    events = ai::decode_server_message(json::array());
    REQUIRE(std::get<ai::OtherEvent>(events.at(0)).kind == "unknown");
}

TEST_CASE("non-audio inline data is skipped") {
    const json message = {
        {"serverContent",
         {{"modelTurn",
           {{"parts", json::array({json{{"inlineData", {{"mimeType", "image/png"},
                                                        {"data", "AAAA"}}}}})}}}}}};
    const auto events = ai::decode_server_message(message);
    REQUIRE(events.size() == 1);
    REQUIRE(std::get<ai::OtherEvent>(events[0]).kind == "unknown");
}
