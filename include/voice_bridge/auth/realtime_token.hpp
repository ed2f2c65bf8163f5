#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace voice_bridge {
namespace auth {

struct RealtimeClaims {
    std::string user_id;
    int64_t expires_at = 0;
};

// HS256 tokens with typ == "realtime", a user_id claim and an exp claim.
class RealtimeTokenVerifier {
public:
    explicit RealtimeTokenVerifier(std::optional<std::string> secret);

    // Throws ConfigurationError without a secret and AuthenticationError for
    // any malformed, mis-signed, expired or mistyped token.
    RealtimeClaims verify(const std::string& token,
                          std::chrono::system_clock::time_point now =
                              std::chrono::system_clock::now()) const;

    std::string issue(const std::string& user_id,
                      std::chrono::seconds ttl,
                      std::chrono::system_clock::time_point now =
                          std::chrono::system_clock::now()) const;

private:
    const std::string& require_secret() const;

    std::optional<std::string> secret_;
};

}
}
