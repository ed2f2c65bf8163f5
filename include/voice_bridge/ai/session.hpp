#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "voice_bridge/ai/protocol.hpp"

namespace voice_bridge {
namespace ai {

struct AiSessionOptions {
    std::string system_instruction;
    std::string label;
};

// One bidirectional speech-to-speech connection. Implementations close the
// connection in their destructor, so holding the session in a unique_ptr is
// enough to release it on every exit path.
class AiSpeechSession {
public:
    virtual ~AiSpeechSession() = default;

    // Forwards raw 16kHz PCM as realtime input. Throws AIServiceError.
    virtual void send_audio(const std::vector<int16_t>& pcm16k) = 0;

    // Blocks for the next event. Returns nullopt once the session is closed
    // locally or ends normally; throws AIServiceError on an upstream failure.
    virtual std::optional<AiEvent> receive() = 0;

    // Idempotent. Unblocks a pending receive().
    virtual void close() = 0;
};

class AiSessionFactory {
public:
    virtual ~AiSessionFactory() = default;

    // Throws AIServiceError when the session cannot be established.
    virtual std::unique_ptr<AiSpeechSession> open(const AiSessionOptions& options) = 0;
};

}
}
