#pragma once

#include <string>

namespace voice_bridge::utils {

std::string base64_encode(const std::string& data);
// Throws std::invalid_argument on malformed input.
std::string base64_decode(const std::string& encoded);

std::string base64url_encode(const std::string& data);
std::string base64url_decode(const std::string& encoded);

std::string hmac_sha1(const std::string& key, const std::string& data);
std::string hmac_sha256(const std::string& key, const std::string& data);

bool constant_time_equals(const std::string& lhs, const std::string& rhs);

}
