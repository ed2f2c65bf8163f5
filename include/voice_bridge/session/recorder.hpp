#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "voice_bridge/persistence/store.hpp"

namespace voice_bridge {
namespace session {

enum class Sender {
    Caller,
    Ai,
    System,
};

const char* to_string(Sender sender);

// Where transcript lines are mirrored in the chat tables. A known conversation
// wins over a lookup by customer; with neither set nothing is mirrored.
struct ChatMirror {
    std::optional<std::string> conversation_id;
    std::optional<std::string> customer_id;
};

// Persists one voice session and its transcript. Calls return immediately;
// the writes run in order on a worker owned by the recorder. Store failures
// are logged and dropped.
class SessionRecorder {
public:
    SessionRecorder(persistence::VoiceStore& store, std::string assistant_user_id);
    ~SessionRecorder();

    SessionRecorder(const SessionRecorder&) = delete;
    SessionRecorder& operator=(const SessionRecorder&) = delete;

    // Assigns id and started_at, queues the insert and returns the id.
    std::string start(persistence::VoiceSessionRecord record, ChatMirror mirror = {});

    // Appends a VoiceMessage; Caller and Ai lines are also mirrored to chat.
    void append(Sender sender, const std::string& text);

    // Marks the session ended. Only the first call has an effect.
    void end();

    // Waits for queued writes and stops the worker.
    void drain();

    bool started() const;
    std::string session_id() const;

private:
    using Task = std::function<void()>;

    void enqueue(Task task);
    void worker_loop();
    std::string next_timestamp();
    void mirror_line(const std::string& sender_id, const std::string& text,
                     const std::string& created_at);

    persistence::VoiceStore& store_;
    std::string assistant_user_id_;

    mutable std::mutex state_mutex_;
    std::optional<persistence::VoiceSessionRecord> record_;
    ChatMirror mirror_;
    bool ended_ = false;
    std::chrono::system_clock::time_point last_timestamp_{};

    // Worker-only.
    std::optional<std::string> resolved_conversation_;

    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<Task> tasks_;
    bool stop_worker_ = false;
    std::thread worker_;
};

}
}
