#include "voice_bridge/signaling/handler.hpp"

#include <sstream>

#include "voice_bridge/errors.hpp"
#include "voice_bridge/logging.hpp"
#include "voice_bridge/utils/crypto.hpp"
#include "voice_bridge/utils/http.hpp"

namespace voice_bridge {
namespace signaling {

std::string compute_signature(const std::string& auth_token,
                              const std::string& url,
                              const std::map<std::string, std::string>& form) {
    // std::map iterates in key order.
    std::string data = url;
    for (const auto& [key, value] : form) {
        data += key;
        data += value;
    }
    return utils::base64_encode(utils::hmac_sha1(auth_token, data));
}

std::string build_connect_twiml(const std::string& greeting,
                                const std::string& voice,
                                const std::string& stream_url,
                                const std::string& from,
                                const std::string& call_sid) {
    std::ostringstream out;
    out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        << "<Response>\n"
        << "  <Say voice=\"" << utils::xml_escape(voice) << "\">"
        << utils::xml_escape(greeting) << "</Say>\n"
        << "  <Connect>\n"
        << "    <Stream url=\"" << utils::xml_escape(stream_url) << "\">\n"
        << "      <Parameter name=\"from\" value=\"" << utils::xml_escape(from) << "\"/>\n"
        << "      <Parameter name=\"callSid\" value=\"" << utils::xml_escape(call_sid) << "\"/>\n"
        << "    </Stream>\n"
        << "  </Connect>\n"
        << "</Response>";
    return out.str();
}

SignalingHandler::SignalingHandler(const Config& config) : config_(config) {}

std::string SignalingHandler::handle_voice_webhook(const VoiceWebhook& request) const {
    if (config_.twilio_validate_signature) {
        if (!config_.twilio_auth_token) {
            throw ConfigurationError("TWILIO_AUTH_TOKEN not configured");
        }
        const auto expected = compute_signature(*config_.twilio_auth_token,
                                                signed_url(request), request.form);
        if (request.signature.empty() ||
            !utils::constant_time_equals(expected, request.signature)) {
            logging::warn("Rejected voice webhook with invalid signature",
                          {kv("path", request.path)});
            throw AuthenticationError("Invalid Twilio signature");
        }
    }

    const auto stream_url = config_.media_socket_base() + kTelephonyMediaPath;
    const auto from_it = request.form.find("From");
    const auto call_sid_it = request.form.find("CallSid");
    const std::string from = from_it != request.form.end() ? from_it->second : "";
    const std::string call_sid = call_sid_it != request.form.end() ? call_sid_it->second : "";

    logging::info("Accepted voice webhook", {kv("call_sid", call_sid), kv("from", from)});
    return build_connect_twiml(config_.opening_greeting, config_.greeting_voice, stream_url,
                               from, call_sid);
}

std::string SignalingHandler::signed_url(const VoiceWebhook& request) const {
    std::string base = config_.public_base_url;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    if (base.empty()) {
        base = "http://" + request.host;
    }
    return base + request.path;
}

}
}
