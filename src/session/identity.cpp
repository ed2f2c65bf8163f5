#include "voice_bridge/session/identity.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

#include "voice_bridge/errors.hpp"
#include "voice_bridge/logging.hpp"

namespace voice_bridge {
namespace session {

namespace {

bool is_digit(char ch) {
    return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

std::string trim(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

}

std::string normalize_phone_e164(const std::string& phone) {
    const auto raw = trim(phone);
    if (raw.empty()) {
        return "";
    }
    if (raw.front() == '+') {
        const auto digits = raw.substr(1);
        const bool all_digits = !digits.empty() && std::all_of(digits.begin(), digits.end(), is_digit);
        if (all_digits && digits.size() >= 8 && digits.size() <= 15 && digits.front() != '0') {
            return "+" + digits;
        }
        return "";
    }
    std::string digits;
    std::copy_if(raw.begin(), raw.end(), std::back_inserter(digits), is_digit);
    if (digits.size() == 10) {
        return "+1" + digits;
    }
    if (digits.size() == 11 && digits.front() == '1') {
        return "+" + digits;
    }
    return "";
}

CallerIdentityResolver::CallerIdentityResolver(persistence::VoiceStore& store) : store_(store) {}

CallerIdentity CallerIdentityResolver::resolve(const std::string& phone_e164) {
    if (phone_e164.empty()) {
        return {};
    }

    std::optional<persistence::ClientAccount> account;
    try {
        account = store_.find_client_by_phone(phone_e164);
    } catch (const PersistenceError& ex) {
        logging::warn("Client lookup failed", {kv("phone", phone_e164), kv("error", ex.what())});
    }

    if (!account) {
        try {
            account = store_.create_client_placeholder(phone_e164);
            logging::info("Created placeholder client", {kv("phone", phone_e164),
                                                         kv("client_id", account->id)});
        } catch (const PersistenceError& ex) {
            logging::warn("Failed to create placeholder client",
                          {kv("phone", phone_e164), kv("error", ex.what())});
            return {};
        }
    }
    return CallerIdentity{account->id, account->user_id};
}

}
}
