#pragma once

#include <map>
#include <string>

#include "voice_bridge/config.hpp"

namespace voice_bridge {
namespace signaling {

constexpr const char* kTelephonyMediaPath = "/ws/twilio-media";

struct VoiceWebhook {
    std::string path;
    std::string host;
    std::map<std::string, std::string> form;
    std::string signature;
};

// base64(HMAC-SHA1(token, url + key1 + value1 + key2 + value2 ...)), keys sorted.
std::string compute_signature(const std::string& auth_token,
                              const std::string& url,
                              const std::map<std::string, std::string>& form);

std::string build_connect_twiml(const std::string& greeting,
                                const std::string& voice,
                                const std::string& stream_url,
                                const std::string& from,
                                const std::string& call_sid);

class SignalingHandler {
public:
    explicit SignalingHandler(const Config& config);

    // Returns the call-control document. Throws AuthenticationError on a bad
    // signature and ConfigurationError when no public address is configured.
    std::string handle_voice_webhook(const VoiceWebhook& request) const;

private:
    std::string signed_url(const VoiceWebhook& request) const;

    const Config& config_;
};

}
}
