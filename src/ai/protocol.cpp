#include "voice_bridge/ai/protocol.hpp"

#include <cctype>

#include "voice_bridge/audio/transcoder.hpp"
#include "voice_bridge/utils/crypto.hpp"

namespace voice_bridge {
namespace ai {

namespace {

// 999999 Hz is far above any PCM rate the provider emits.
constexpr size_t kMaxRateDigits = 6;

std::string text_field(const nlohmann::json& object, const char* key) {
    if (!object.is_object()) {
        return {};
    }
    const auto it = object.find(key);
    if (it == object.end() || !it->is_object()) {
        return {};
    }
    const auto text = it->find("text");
    if (text == it->end() || !text->is_string()) {
        return {};
    }
    return text->get<std::string>();
}

void decode_model_turn(const nlohmann::json& content, std::vector<AiEvent>& events) {
    const auto turn = content.find("modelTurn");
    if (turn == content.end() || !turn->is_object()) {
        return;
    }
    const auto parts = turn->find("parts");
    if (parts == turn->end() || !parts->is_array()) {
        return;
    }
    for (const auto& part : *parts) {
        const auto inline_data = part.find("inlineData");
        if (inline_data == part.end() || !inline_data->is_object()) {
            continue;
        }
        const auto mime = inline_data->value("mimeType", "");
        const auto data = inline_data->value("data", "");
        if (data.empty() || mime.find("audio/pcm") == std::string::npos) {
            continue;
        }
        AudioChunk chunk;
        chunk.sample_rate = parse_pcm_rate(mime);
        chunk.samples = audio::pcm16_from_bytes(utils::base64_decode(data));
        if (!chunk.samples.empty()) {
            events.emplace_back(std::move(chunk));
        }
    }
}

}

int parse_pcm_rate(const std::string& mime_type) {
    const auto pos = mime_type.find("rate=");
    if (pos == std::string::npos) {
        return audio::kModelOutputSampleRate;
    }
    int rate = 0;
    size_t digits = 0;
    for (size_t i = pos + 5; i < mime_type.size(); ++i) {
        const auto ch = static_cast<unsigned char>(mime_type[i]);
        if (!std::isdigit(ch)) {
            break;
        }
        if (++digits > kMaxRateDigits) {
            return audio::kModelOutputSampleRate;
        }
        rate = rate * 10 + (ch - '0');
    }
    return rate > 0 ? rate : audio::kModelOutputSampleRate;
}

nlohmann::json build_setup_message(const std::string& model,
                                   const std::string& system_instruction) {
    const auto model_name = model.rfind("models/", 0) == 0 ? model : "models/" + model;
    nlohmann::json setup;
    setup["model"] = model_name;
    setup["generationConfig"] = {
        {"responseModalities", nlohmann::json::array({"AUDIO", "TEXT"})}};
    const nlohmann::json instruction_part = {{"text", system_instruction}};
    setup["systemInstruction"] = {{"parts", nlohmann::json::array({instruction_part})}};
    setup["inputAudioTranscription"] = nlohmann::json::object();
    setup["outputAudioTranscription"] = nlohmann::json::object();
    setup["realtimeInputConfig"] = {{"activityHandling", "START_OF_ACTIVITY_INTERRUPTS"}};
    return {{"setup", setup}};
}

nlohmann::json build_audio_message(const std::vector<int16_t>& pcm16k) {
    return {{"realtimeInput",
             {{"audio",
               {{"mimeType", "audio/pcm;rate=16000"},
                {"data", utils::base64_encode(audio::pcm16_to_bytes(pcm16k))}}}}}};
}

std::vector<AiEvent> decode_server_message(const nlohmann::json& message) {
    std::vector<AiEvent> events;
    if (!message.is_object()) {
        events.emplace_back(OtherEvent{"unknown"});
        return events;
    }
    if (message.contains("setupComplete")) {
        events.emplace_back(OtherEvent{"setup_complete"});
    }

    const auto content = message.find("serverContent");
    if (content != message.end() && content->is_object()) {
        auto input_text = text_field(*content, "inputTranscription");
        if (!input_text.empty()) {
            events.emplace_back(InputTranscript{std::move(input_text)});
        }
        auto output_text = text_field(*content, "outputTranscription");
        if (!output_text.empty()) {
            events.emplace_back(OutputTranscript{std::move(output_text)});
        }
        decode_model_turn(*content, events);
        if (content->value("interrupted", false)) {
            events.emplace_back(OtherEvent{"interrupted"});
        }
        if (content->value("turnComplete", false)) {
            events.emplace_back(OtherEvent{"turn_complete"});
        }
    }

    if (message.contains("goAway")) {
        events.emplace_back(OtherEvent{"go_away"});
    }
    if (events.empty()) {
        events.emplace_back(OtherEvent{"unknown"});
    }
    return events;
}

}
}
