#pragma once

#include <optional>
#include <string>

namespace voice_bridge {

struct Config {
    int http_port = 8000;
    int ws_port = 8001;
    std::string public_base_url;
    std::optional<std::string> public_ws_base_url;

    std::optional<std::string> twilio_auth_token;
    bool twilio_validate_signature = true;
    std::optional<std::string> realtime_jwt_secret;

    std::string gemini_api_key;
    std::string gemini_model = "gemini-2.5-flash-native-audio-preview-12-2025";
    std::string gemini_host = "generativelanguage.googleapis.com";
    // ws:// or wss:// origin replacing https://gemini_host, e.g. a local relay.
    std::optional<std::string> gemini_base_url;
    int ai_connect_timeout_ms = 10000;

    std::string supabase_url;
    std::string supabase_service_role_key;
    double persistence_timeout_sec = 10.0;
    std::string assistant_user_id = "00000000-0000-0000-0000-000000000000";

    std::string system_prompt =
        "You are a customer service assistant. Be concise, friendly, and helpful. "
        "Ask clarifying questions when needed. If interrupted, stop speaking immediately.";
    std::string opening_greeting =
        "Thanks for calling. One moment while I connect you to our assistant.";
    std::string greeting_voice = "Polly.Joanna";

    std::string vad_backend = "energy";
    int vad_aggressiveness = 2;
    std::string vad_model_path;

    std::string log_level = "INFO";
    std::optional<std::string> log_filename;
    std::string log_name = "voice_bridge";

    static Config load();
    void validate() const;

    // Base address the carrier uses to reach the media socket (ws:// or wss://).
    // Throws ConfigurationError when no public address is configured.
    std::string media_socket_base() const;
};

}
