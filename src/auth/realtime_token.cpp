#include "voice_bridge/auth/realtime_token.hpp"

#include <stdexcept>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "voice_bridge/errors.hpp"
#include "voice_bridge/utils/crypto.hpp"

namespace voice_bridge {
namespace auth {

namespace {

constexpr const char* kInvalidToken = "Invalid or expired token";

std::vector<std::string> split_segments(const std::string& token) {
    std::vector<std::string> segments;
    size_t start = 0;
    while (true) {
        const auto dot = token.find('.', start);
        if (dot == std::string::npos) {
            segments.push_back(token.substr(start));
            break;
        }
        segments.push_back(token.substr(start, dot - start));
        start = dot + 1;
    }
    return segments;
}

nlohmann::json decode_segment(const std::string& segment) {
    try {
        auto value = nlohmann::json::parse(utils::base64url_decode(segment));
        if (!value.is_object()) {
            throw AuthenticationError(kInvalidToken);
        }
        return value;
    } catch (const std::invalid_argument&) {
        throw AuthenticationError(kInvalidToken);
    } catch (const nlohmann::json::exception&) {
        throw AuthenticationError(kInvalidToken);
    }
}

int64_t to_epoch_seconds(std::chrono::system_clock::time_point time) {
    return std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
}

}

RealtimeTokenVerifier::RealtimeTokenVerifier(std::optional<std::string> secret)
    : secret_(std::move(secret)) {}

RealtimeClaims RealtimeTokenVerifier::verify(const std::string& token,
                                             std::chrono::system_clock::time_point now) const {
    const auto& secret = require_secret();
    const auto segments = split_segments(token);
    if (segments.size() != 3 || segments[0].empty() || segments[1].empty()) {
        throw AuthenticationError(kInvalidToken);
    }

    const auto header = decode_segment(segments[0]);
    if (header.value("alg", "") != "HS256") {
        throw AuthenticationError(kInvalidToken);
    }

    const auto expected = utils::base64url_encode(
        utils::hmac_sha256(secret, segments[0] + "." + segments[1]));
    if (!utils::constant_time_equals(expected, segments[2])) {
        throw AuthenticationError(kInvalidToken);
    }

    const auto payload = decode_segment(segments[1]);
    const auto exp = payload.find("exp");
    if (exp == payload.end() || !exp->is_number()) {
        throw AuthenticationError(kInvalidToken);
    }
    const auto expires_at = exp->get<int64_t>();
    if (to_epoch_seconds(now) >= expires_at) {
        throw AuthenticationError(kInvalidToken);
    }
    if (payload.value("typ", "") != "realtime") {
        throw AuthenticationError("Invalid token type");
    }
    const auto user_id = payload.find("user_id");
    if (user_id == payload.end() || !user_id->is_string() || user_id->get<std::string>().empty()) {
        throw AuthenticationError("Missing user");
    }
    return RealtimeClaims{user_id->get<std::string>(), expires_at};
}

std::string RealtimeTokenVerifier::issue(const std::string& user_id,
                                         std::chrono::seconds ttl,
                                         std::chrono::system_clock::time_point now) const {
    const auto& secret = require_secret();
    const nlohmann::json header{{"alg", "HS256"}, {"typ", "JWT"}};
    const nlohmann::json payload{{"typ", "realtime"},
                                 {"user_id", user_id},
                                 {"iat", to_epoch_seconds(now)},
                                 {"exp", to_epoch_seconds(now + ttl)}};
    const auto signing_input =
        utils::base64url_encode(header.dump()) + "." + utils::base64url_encode(payload.dump());
    return signing_input + "." + utils::base64url_encode(utils::hmac_sha256(secret, signing_input));
}

const std::string& RealtimeTokenVerifier::require_secret() const {
    if (!secret_ || secret_->empty()) {
        throw ConfigurationError("REALTIME_JWT_SECRET not configured");
    }
    return *secret_;
}

}
}
