#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "voice_bridge/ai/session.hpp"
#include "voice_bridge/config.hpp"
#include "voice_bridge/utils/blocking_queue.hpp"

namespace voice_bridge {
namespace ai {

namespace detail {
class LiveTransport;
}

// Gemini Live BidiGenerateContent over a TLS WebSocket. The constructor
// returns once the server has acknowledged the setup message.
class GeminiLiveSession : public AiSpeechSession {
public:
    GeminiLiveSession(const Config& config, const AiSessionOptions& options);
    ~GeminiLiveSession() override;

    GeminiLiveSession(const GeminiLiveSession&) = delete;
    GeminiLiveSession& operator=(const GeminiLiveSession&) = delete;

    void send_audio(const std::vector<int16_t>& pcm16k) override;
    std::optional<AiEvent> receive() override;
    void close() override;

private:
    void handle_open();
    void handle_message(const std::string& payload);
    void handle_ended(const std::string& reason, bool failure);
    void shutdown();
    std::string make_url(std::string& tls_host) const;

    const Config& config_;
    AiSessionOptions options_;
    utils::BlockingQueue<AiEvent> events_;
    std::thread worker_;
    std::mutex state_mutex_;
    std::condition_variable state_cv_;
    bool ready_ = false;
    bool ended_ = false;
    std::optional<std::string> failure_;
    std::atomic<bool> closing_{false};
    std::unique_ptr<detail::LiveTransport> transport_;
};

class GeminiSessionFactory : public AiSessionFactory {
public:
    explicit GeminiSessionFactory(const Config& config);

    std::unique_ptr<AiSpeechSession> open(const AiSessionOptions& options) override;

private:
    const Config& config_;
};

}
}
