#pragma once

#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace voice_bridge {
namespace persistence {

struct ClientAccount {
    std::string id;
    std::optional<std::string> user_id;
};

struct VoiceSessionRecord {
    std::string id;
    std::string channel;
    std::optional<std::string> user_id;
    std::optional<std::string> client_id;
    std::optional<std::string> call_sid;
    std::optional<std::string> stream_sid;
    std::optional<std::string> from_phone;
    std::string status = "active";
    std::string started_at;
    nlohmann::json metadata = nlohmann::json::object();
};

struct VoiceMessageRecord {
    std::string id;
    std::string voice_session_id;
    std::string sender;
    std::string text;
    std::string created_at;
};

struct ChatMessageRecord {
    std::string id;
    std::string conversation_id;
    std::string sender_id;
    std::string message;
    std::string created_at;
};

// Business database as seen by the bridges. Every method throws
// PersistenceError on failure.
class VoiceStore {
public:
    virtual ~VoiceStore() = default;

    virtual std::optional<ClientAccount> find_client_by_phone(const std::string& phone_e164) = 0;
    virtual ClientAccount create_client_placeholder(const std::string& phone_e164) = 0;

    virtual void insert_session(const VoiceSessionRecord& session) = 0;
    virtual void mark_session_ended(const std::string& session_id,
                                    const std::string& ended_at) = 0;
    virtual void insert_message(const VoiceMessageRecord& message) = 0;

    // Owner (customer_id) of a chat conversation, or nullopt when it does not exist.
    virtual std::optional<std::string> find_conversation_owner(
        const std::string& conversation_id) = 0;
    virtual std::string find_or_create_conversation(const std::string& customer_id,
                                                    const std::string& now) = 0;
    virtual void insert_chat_message(const ChatMessageRecord& message) = 0;
    virtual void touch_conversation(const std::string& conversation_id,
                                    const std::string& now) = 0;
};

// Every bridged session gets its own store, so one session's slow writes never
// hold up another session's lookups on a shared connection.
class VoiceStoreFactory {
public:
    virtual ~VoiceStoreFactory() = default;

    virtual std::unique_ptr<VoiceStore> create() = 0;
};

}
}
