#pragma once

#include "voice_bridge/ai/session.hpp"
#include "voice_bridge/bridge/socket.hpp"
#include "voice_bridge/config.hpp"
#include "voice_bridge/persistence/store.hpp"
#include "voice_bridge/vad/classifier.hpp"

namespace voice_bridge {
namespace bridge {

// Carrier media stream <-> AI session, one call per run(). Waits for the
// carrier's start event, records the session, then pumps audio both ways
// with barge-in detection until either side ends.
class TelephonyBridge {
public:
    TelephonyBridge(const Config& config,
                    ai::AiSessionFactory& ai_factory,
                    persistence::VoiceStoreFactory& stores,
                    vad::ClassifierFactory& classifiers);

    // Owns the socket for the lifetime of the call and closes it on return.
    // Failures end only this call and are logged, never thrown.
    void run(MediaSocket& socket);

private:
    const Config& config_;
    ai::AiSessionFactory& ai_factory_;
    persistence::VoiceStoreFactory& stores_;
    vad::ClassifierFactory& classifiers_;
};

}
}
