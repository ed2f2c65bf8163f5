#pragma once

#include "voice_bridge/ai/session.hpp"
#include "voice_bridge/auth/realtime_token.hpp"
#include "voice_bridge/bridge/socket.hpp"
#include "voice_bridge/config.hpp"
#include "voice_bridge/persistence/store.hpp"

namespace voice_bridge {
namespace bridge {

// Browser microphone <-> AI session. The first frame must be a start message
// with a realtime token; nothing is allocated until it has been verified.
class BrowserBridge {
public:
    BrowserBridge(const Config& config,
                  ai::AiSessionFactory& ai_factory,
                  persistence::VoiceStoreFactory& stores);

    // Closes the socket on return. Failures are reported to the browser as
    // an error message and logged, never thrown.
    void run(MediaSocket& socket);

private:
    const Config& config_;
    ai::AiSessionFactory& ai_factory_;
    persistence::VoiceStoreFactory& stores_;
    auth::RealtimeTokenVerifier verifier_;
};

}
}
