#include "voice_bridge/utils/crypto.hpp"

#include <stdexcept>
#include <vector>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace voice_bridge::utils {

namespace {

std::string hmac_digest(const EVP_MD* md, const std::string& key, const std::string& data) {
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int out_len = 0;
    const auto* result = HMAC(md, key.data(), static_cast<int>(key.size()),
                              reinterpret_cast<const unsigned char*>(data.data()),
                              data.size(), out, &out_len);
    if (!result) {
        throw std::runtime_error("HMAC computation failed");
    }
    return std::string(reinterpret_cast<const char*>(out), out_len);
}

}

std::string base64_encode(const std::string& data) {
    if (data.empty()) {
        return {};
    }
    std::vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
    const int written = EVP_EncodeBlock(out.data(),
                                        reinterpret_cast<const unsigned char*>(data.data()),
                                        static_cast<int>(data.size()));
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(written));
}

std::string base64_decode(const std::string& encoded) {
    if (encoded.empty()) {
        return {};
    }
    if (encoded.size() % 4 != 0) {
        throw std::invalid_argument("base64 input length is not a multiple of 4");
    }
    std::vector<unsigned char> out(encoded.size() / 4 * 3 + 1);
    const int written = EVP_DecodeBlock(out.data(),
                                        reinterpret_cast<const unsigned char*>(encoded.data()),
                                        static_cast<int>(encoded.size()));
    if (written < 0) {
        throw std::invalid_argument("invalid base64 input");
    }
    // EVP_DecodeBlock keeps the zero bytes produced by '=' padding.
    size_t padding = 0;
    if (encoded[encoded.size() - 1] == '=') ++padding;
    if (encoded[encoded.size() - 2] == '=') ++padding;
    return std::string(reinterpret_cast<const char*>(out.data()),
                       static_cast<size_t>(written) - padding);
}

std::string base64url_encode(const std::string& data) {
    std::string encoded = base64_encode(data);
    for (auto& ch : encoded) {
        if (ch == '+') ch = '-';
        else if (ch == '/') ch = '_';
    }
    while (!encoded.empty() && encoded.back() == '=') {
        encoded.pop_back();
    }
    return encoded;
}

std::string base64url_decode(const std::string& encoded) {
    std::string standard = encoded;
    for (auto& ch : standard) {
        if (ch == '-') ch = '+';
        else if (ch == '_') ch = '/';
    }
    while (standard.size() % 4 != 0) {
        standard.push_back('=');
    }
    return base64_decode(standard);
}

std::string hmac_sha1(const std::string& key, const std::string& data) {
    return hmac_digest(EVP_sha1(), key, data);
}

std::string hmac_sha256(const std::string& key, const std::string& data) {
    return hmac_digest(EVP_sha256(), key, data);
}

bool constant_time_equals(const std::string& lhs, const std::string& rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    return CRYPTO_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}

}
