#pragma once

#include <optional>
#include <string>

#include "voice_bridge/persistence/store.hpp"

namespace voice_bridge {
namespace session {

struct CallerIdentity {
    std::optional<std::string> client_id;
    std::optional<std::string> user_id;
};

// E.164 form of a caller number, or an empty string when the input cannot be
// normalized.
std::string normalize_phone_e164(const std::string& phone);

// Maps a caller number to a client account, creating a placeholder account for
// unknown numbers. Never throws: store failures yield an anonymous identity.
class CallerIdentityResolver {
public:
    explicit CallerIdentityResolver(persistence::VoiceStore& store);

    CallerIdentity resolve(const std::string& phone_e164);

private:
    persistence::VoiceStore& store_;
};

}
}
