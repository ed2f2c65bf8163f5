#include "voice_bridge/config.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

#include "voice_bridge/errors.hpp"

namespace voice_bridge {

namespace {

std::string get_env_str(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : fallback;
}

std::optional<std::string> get_env_optional(const char* name) {
    const char* value = std::getenv(name);
    if (!value) {
        return std::nullopt;
    }
    std::string result(value);
    if (result.empty()) {
        return std::nullopt;
    }
    return result;
}

bool get_env_bool(const char* name, bool fallback) {
    const char* value = std::getenv(name);
    if (!value) {
        return fallback;
    }
    std::string normalized(value);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return normalized == "true" || normalized == "1";
}

int get_env_int(const char* name, int fallback) {
    const char* value = std::getenv(name);
    if (!value) {
        return fallback;
    }
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        throw ConfigurationError(std::string(name) + " must be an integer");
    }
}

double get_env_double(const char* name, double fallback) {
    const char* value = std::getenv(name);
    if (!value) {
        return fallback;
    }
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        throw ConfigurationError(std::string(name) + " must be a number");
    }
}

std::string trim(std::string value) {
    auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(),
                                            [&](unsigned char ch) { return !is_space(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(),
                             [&](unsigned char ch) { return !is_space(ch); }).base(),
                value.end());
    return value;
}

std::string timestamp_suffix() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_value{};
    localtime_r(&time_t, &tm_value);
    std::ostringstream stream;
    stream << std::put_time(&tm_value, "%Y%m%d_%H%M%S");
    return stream.str();
}

std::string strip_quotes(std::string value) {
    if (value.size() < 2) {
        return value;
    }
    if ((value.front() == '"' && value.back() == '"') ||
        (value.front() == '\'' && value.back() == '\'')) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

// Values already present in the environment win over the .env file.
void load_dotenv() {
    const std::filesystem::path dotenv_path = std::filesystem::current_path() / ".env";
    if (!std::filesystem::exists(dotenv_path)) {
        return;
    }

    std::ifstream stream(dotenv_path);
    if (!stream.is_open()) {
        return;
    }

    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty() || line.rfind("#", 0) == 0) {
            continue;
        }
        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }
        const auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }
        std::string key = trim(line.substr(0, eq_pos));
        std::string value = strip_quotes(trim(line.substr(eq_pos + 1)));
        if (key.empty()) {
            continue;
        }
        setenv(key.c_str(), value.c_str(), 0);
    }
}

std::string strip_trailing_slash(std::string value) {
    while (!value.empty() && value.back() == '/') {
        value.pop_back();
    }
    return value;
}

}

Config Config::load() {
    load_dotenv();
    Config config;

    config.http_port = get_env_int("HTTP_PORT", 8000);
    config.ws_port = get_env_int("WS_PORT", 8001);
    config.public_base_url = trim(get_env_str("PUBLIC_BASE_URL", ""));
    config.public_ws_base_url = get_env_optional("PUBLIC_WS_BASE_URL");

    config.twilio_auth_token = get_env_optional("TWILIO_AUTH_TOKEN");
    config.twilio_validate_signature = get_env_bool("TWILIO_VALIDATE_SIGNATURE", true);
    config.realtime_jwt_secret = get_env_optional("REALTIME_JWT_SECRET");

    config.gemini_api_key = trim(get_env_str("GEMINI_API_KEY", ""));
    config.gemini_model = get_env_str("GEMINI_MODEL", config.gemini_model);
    config.gemini_host = get_env_str("GEMINI_HOST", config.gemini_host);
    config.gemini_base_url = get_env_optional("GEMINI_BASE_URL");
    config.ai_connect_timeout_ms = get_env_int("AI_CONNECT_TIMEOUT_MS", 10000);

    config.supabase_url = trim(get_env_str("SUPABASE_URL", ""));
    config.supabase_service_role_key = trim(get_env_str("SUPABASE_SERVICE_ROLE_KEY", ""));
    config.persistence_timeout_sec = get_env_double("PERSISTENCE_TIMEOUT_SEC", 10.0);
    config.assistant_user_id = get_env_str("ASSISTANT_USER_ID", config.assistant_user_id);

    config.system_prompt = get_env_str("VOICE_SYSTEM_PROMPT", config.system_prompt);
    config.opening_greeting = get_env_str("VOICE_OPENING_GREETING", config.opening_greeting);
    config.greeting_voice = get_env_str("VOICE_GREETING_VOICE", config.greeting_voice);

    config.vad_backend = get_env_str("VAD_BACKEND", "energy");
    config.vad_aggressiveness = get_env_int("VAD_AGGRESSIVENESS", 2);
    config.vad_model_path = get_env_str("VAD_MODEL_PATH", "");

    config.log_level = get_env_str("LOG_LEVEL", "INFO");
    const auto log_filename_raw = get_env_str("LOG_FILENAME", "");
    if (!log_filename_raw.empty()) {
        const std::filesystem::path log_path(log_filename_raw);
        const auto stamped = log_path.stem().string() + "_" + timestamp_suffix() +
                             log_path.extension().string();
        if (const auto log_dir = get_env_optional("LOGS_DIR")) {
            config.log_filename = (std::filesystem::path(*log_dir) / stamped).string();
        } else {
            config.log_filename = stamped;
        }
    }
    config.log_name = get_env_str("LOG_NAME", "voice_bridge");

    return config;
}

void Config::validate() const {
    if (http_port <= 0) {
        throw ConfigurationError("HTTP_PORT must be positive");
    }
    if (ws_port <= 0) {
        throw ConfigurationError("WS_PORT must be positive");
    }
    if (gemini_api_key.empty()) {
        throw ConfigurationError("GEMINI_API_KEY is required");
    }
    if (supabase_url.empty()) {
        throw ConfigurationError("SUPABASE_URL is required");
    }
    if (supabase_service_role_key.empty()) {
        throw ConfigurationError("SUPABASE_SERVICE_ROLE_KEY is required");
    }
    if (twilio_validate_signature && !twilio_auth_token) {
        throw ConfigurationError(
            "TWILIO_AUTH_TOKEN is required unless TWILIO_VALIDATE_SIGNATURE=false");
    }
    if (vad_aggressiveness < 0 || vad_aggressiveness > 3) {
        throw ConfigurationError("VAD_AGGRESSIVENESS must be between 0 and 3");
    }
    if (vad_backend != "energy" && vad_backend != "silero") {
        throw ConfigurationError("VAD_BACKEND must be 'energy' or 'silero'");
    }
    if (vad_backend == "silero" && vad_model_path.empty()) {
        throw ConfigurationError("VAD_MODEL_PATH is required for the silero backend");
    }
    if (gemini_base_url && gemini_base_url->rfind("ws://", 0) != 0 &&
        gemini_base_url->rfind("wss://", 0) != 0) {
        throw ConfigurationError("GEMINI_BASE_URL must start with ws:// or wss://");
    }
    if (ai_connect_timeout_ms <= 0) {
        throw ConfigurationError("AI_CONNECT_TIMEOUT_MS must be positive");
    }
}

std::string Config::media_socket_base() const {
    std::string base = public_ws_base_url ? *public_ws_base_url : public_base_url;
    if (base.empty()) {
        throw ConfigurationError("PUBLIC_BASE_URL not configured");
    }
    if (base.rfind("https://", 0) == 0) {
        base = "wss://" + base.substr(8);
    } else if (base.rfind("http://", 0) == 0) {
        base = "ws://" + base.substr(7);
    }
    return strip_trailing_slash(base);
}

}
