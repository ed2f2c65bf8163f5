#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace voice_bridge {
namespace ai {

struct InputTranscript {
    std::string text;
};

struct OutputTranscript {
    std::string text;
};

struct AudioChunk {
    std::vector<int16_t> samples;
    int sample_rate = 24000;
};

struct OtherEvent {
    std::string kind;
};

using AiEvent = std::variant<InputTranscript, OutputTranscript, AudioChunk, OtherEvent>;

// Rate from an "audio/pcm;rate=N" mime type; 24000 when the parameter is absent.
int parse_pcm_rate(const std::string& mime_type);

nlohmann::json build_setup_message(const std::string& model,
                                   const std::string& system_instruction);
nlohmann::json build_audio_message(const std::vector<int16_t>& pcm16k);

// One provider message may carry several events; they come back in the order
// input transcript, output transcript, audio parts, control flags. A message
// with nothing recognizable yields a single OtherEvent{"unknown"}.
std::vector<AiEvent> decode_server_message(const nlohmann::json& message);

}
}
