#pragma once

#include "voice_bridge/config.hpp"
#include "voice_bridge/persistence/rest_client.hpp"
#include "voice_bridge/persistence/store.hpp"

namespace voice_bridge {
namespace persistence {

class SupabaseStore : public VoiceStore {
public:
    explicit SupabaseStore(const Config& config);

    std::optional<ClientAccount> find_client_by_phone(const std::string& phone_e164) override;
    ClientAccount create_client_placeholder(const std::string& phone_e164) override;

    void insert_session(const VoiceSessionRecord& session) override;
    void mark_session_ended(const std::string& session_id,
                            const std::string& ended_at) override;
    void insert_message(const VoiceMessageRecord& message) override;

    std::optional<std::string> find_conversation_owner(
        const std::string& conversation_id) override;
    std::string find_or_create_conversation(const std::string& customer_id,
                                            const std::string& now) override;
    void insert_chat_message(const ChatMessageRecord& message) override;
    void touch_conversation(const std::string& conversation_id,
                            const std::string& now) override;

private:
    RestClient client_;
};

class SupabaseStoreFactory : public VoiceStoreFactory {
public:
    explicit SupabaseStoreFactory(const Config& config);

    std::unique_ptr<VoiceStore> create() override;

private:
    const Config& config_;
};

}
}
