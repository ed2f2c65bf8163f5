#include "voice_bridge/persistence/supabase_store.hpp"

#include <algorithm>
#include <memory>

#include "voice_bridge/errors.hpp"
#include "voice_bridge/utils/http.hpp"
#include "voice_bridge/utils/ids.hpp"

namespace voice_bridge {
namespace persistence {

namespace {

constexpr const char* kRestPrefix = "/rest/v1";

RestRequestOptions make_options(const Config& config) {
    const auto timeout = std::chrono::seconds(
        std::max<long>(1, static_cast<long>(config.persistence_timeout_sec)));
    RestRequestOptions options;
    options.request_timeout = timeout;
    options.connect_timeout = timeout;
    options.sock_read_timeout = timeout;
    return options;
}

std::string strip_trailing_slash(std::string value) {
    while (!value.empty() && value.back() == '/') {
        value.pop_back();
    }
    return value;
}

nlohmann::json optional_field(const std::optional<std::string>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

std::optional<std::string> string_field(const nlohmann::json& row, const char* key) {
    const auto it = row.find(key);
    if (it == row.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

// PostgREST returns inserted/selected rows as an array.
const nlohmann::json* first_row(const nlohmann::json& payload) {
    if (payload.is_array() && !payload.empty() && payload.front().is_object()) {
        return &payload.front();
    }
    if (payload.is_object()) {
        return &payload;
    }
    return nullptr;
}

ClientAccount to_account(const nlohmann::json& row) {
    const auto id = string_field(row, "id");
    if (!id) {
        throw PersistenceError("clients row without id");
    }
    return ClientAccount{*id, string_field(row, "user_id")};
}

}

SupabaseStore::SupabaseStore(const Config& config)
    : client_(strip_trailing_slash(config.supabase_url) + kRestPrefix,
              {{"apikey", config.supabase_service_role_key},
               {"Authorization", "Bearer " + config.supabase_service_role_key}},
              make_options(config)) {}

std::optional<ClientAccount> SupabaseStore::find_client_by_phone(const std::string& phone_e164) {
    const auto encoded = utils::url_encode(phone_e164);
    const auto rows = client_.get_json(
        "/clients?select=id,user_id,phone_e164,phone&or=(phone_e164.eq." + encoded +
        ",phone.eq." + encoded + ")&limit=1");
    const auto* row = first_row(rows);
    if (!row) {
        return std::nullopt;
    }
    return to_account(*row);
}

ClientAccount SupabaseStore::create_client_placeholder(const std::string& phone_e164) {
    const nlohmann::json body{{"name", "Unknown caller"},
                              {"phone_e164", phone_e164},
                              {"phone", phone_e164},
                              {"registration_source", "admin_created"}};
    const auto rows = client_.post_json("/clients", body);
    const auto* row = first_row(rows);
    if (!row) {
        throw PersistenceError("clients insert returned no row");
    }
    return to_account(*row);
}

void SupabaseStore::insert_session(const VoiceSessionRecord& session) {
    const nlohmann::json body{{"id", session.id},
                              {"channel", session.channel},
                              {"user_id", optional_field(session.user_id)},
                              {"client_id", optional_field(session.client_id)},
                              {"call_sid", optional_field(session.call_sid)},
                              {"stream_sid", optional_field(session.stream_sid)},
                              {"from_phone", optional_field(session.from_phone)},
                              {"status", session.status},
                              {"started_at", session.started_at},
                              {"metadata", session.metadata}};
    client_.post_json("/voice_sessions", body);
}

void SupabaseStore::mark_session_ended(const std::string& session_id,
                                       const std::string& ended_at) {
    const nlohmann::json body{{"status", "ended"}, {"ended_at", ended_at}};
    client_.patch_json("/voice_sessions?id=eq." + utils::url_encode(session_id), body);
}

void SupabaseStore::insert_message(const VoiceMessageRecord& message) {
    const nlohmann::json body{{"id", message.id},
                              {"voice_session_id", message.voice_session_id},
                              {"sender", message.sender},
                              {"text", message.text},
                              {"created_at", message.created_at}};
    client_.post_json("/voice_messages", body);
}

std::optional<std::string> SupabaseStore::find_conversation_owner(
    const std::string& conversation_id) {
    const auto rows = client_.get_json("/chat_conversations?select=id,customer_id&id=eq." +
                                       utils::url_encode(conversation_id) + "&limit=1");
    const auto* row = first_row(rows);
    if (!row) {
        return std::nullopt;
    }
    return string_field(*row, "customer_id").value_or("");
}

std::string SupabaseStore::find_or_create_conversation(const std::string& customer_id,
                                                       const std::string& now) {
    const auto rows = client_.get_json("/chat_conversations?select=id&customer_id=eq." +
                                       utils::url_encode(customer_id) + "&limit=1");
    if (const auto* row = first_row(rows)) {
        if (const auto id = string_field(*row, "id")) {
            return *id;
        }
    }
    const auto conversation_id = utils::generate_uuid_v4();
    const nlohmann::json body{{"id", conversation_id},
                              {"customer_id", customer_id},
                              {"status", "active"},
                              {"created_at", now},
                              {"updated_at", now}};
    client_.post_json("/chat_conversations", body);
    return conversation_id;
}

void SupabaseStore::insert_chat_message(const ChatMessageRecord& message) {
    const nlohmann::json body{{"id", message.id},
                              {"conversation_id", message.conversation_id},
                              {"sender_id", message.sender_id},
                              {"message", message.message},
                              {"message_type", "text"},
                              {"created_at", message.created_at}};
    client_.post_json("/chat_messages", body);
}

void SupabaseStore::touch_conversation(const std::string& conversation_id,
                                       const std::string& now) {
    const nlohmann::json body{{"last_message_at", now}, {"updated_at", now}};
    client_.patch_json("/chat_conversations?id=eq." + utils::url_encode(conversation_id), body);
}

SupabaseStoreFactory::SupabaseStoreFactory(const Config& config) : config_(config) {}

std::unique_ptr<VoiceStore> SupabaseStoreFactory::create() {
    return std::make_unique<SupabaseStore>(config_);
}

}
}
