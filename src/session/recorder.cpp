#include "voice_bridge/session/recorder.hpp"

#include <utility>

#include "voice_bridge/errors.hpp"
#include "voice_bridge/logging.hpp"
#include "voice_bridge/metrics.hpp"
#include "voice_bridge/utils/ids.hpp"

namespace voice_bridge {
namespace session {

const char* to_string(Sender sender) {
    switch (sender) {
        case Sender::Caller:
            return "caller";
        case Sender::Ai:
            return "ai";
        case Sender::System:
            return "system";
    }
    return "system";
}

SessionRecorder::SessionRecorder(persistence::VoiceStore& store, std::string assistant_user_id)
    : store_(store),
      assistant_user_id_(std::move(assistant_user_id)) {
    worker_ = std::thread([this]() { worker_loop(); });
}

SessionRecorder::~SessionRecorder() {
    drain();
}

std::string SessionRecorder::start(persistence::VoiceSessionRecord record, ChatMirror mirror) {
    std::string session_id;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (record_) {
            throw std::logic_error("voice session already started");
        }
        record.id = utils::generate_uuid_v4();
        record.status = "active";
        record.started_at = next_timestamp();
        record_ = record;
        mirror_ = std::move(mirror);
        session_id = record.id;
    }
    enqueue([this, record]() {
        try {
            store_.insert_session(record);
        } catch (const PersistenceError& ex) {
            logging::warn("Failed to insert voice session",
                          {kv("voice_session_id", record.id), kv("error", ex.what())});
        }
    });
    logging::info("Voice session started",
                  {kv("voice_session_id", session_id), kv("channel", record.channel)});
    return session_id;
}

void SessionRecorder::append(Sender sender, const std::string& text) {
    if (text.empty()) {
        return;
    }
    persistence::VoiceMessageRecord message;
    std::optional<std::string> mirror_sender;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!record_) {
            logging::warn("Transcript line before voice session start", {kv("sender", to_string(sender))});
            return;
        }
        message.id = utils::generate_uuid_v4();
        message.voice_session_id = record_->id;
        message.sender = to_string(sender);
        message.text = text;
        message.created_at = next_timestamp();
        const bool mirrored = mirror_.conversation_id || mirror_.customer_id;
        if (mirrored && sender == Sender::Caller) {
            mirror_sender = record_->user_id.value_or("");
        } else if (mirrored && sender == Sender::Ai) {
            mirror_sender = assistant_user_id_;
        }
    }
    if (sender != Sender::System) {
        Metrics::instance().transcript_line(message.sender);
    }
    enqueue([this, message, mirror_sender]() {
        try {
            store_.insert_message(message);
        } catch (const PersistenceError& ex) {
            logging::warn("Failed to append voice message",
                          {kv("voice_session_id", message.voice_session_id),
                           kv("error", ex.what())});
        }
        if (mirror_sender) {
            mirror_line(*mirror_sender, message.text, message.created_at);
        }
    });
}

void SessionRecorder::end() {
    std::string session_id;
    std::string ended_at;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!record_ || ended_) {
            return;
        }
        ended_ = true;
        session_id = record_->id;
        ended_at = next_timestamp();
    }
    enqueue([this, session_id, ended_at]() {
        try {
            store_.mark_session_ended(session_id, ended_at);
        } catch (const PersistenceError& ex) {
            logging::warn("Failed to mark voice session ended",
                          {kv("voice_session_id", session_id), kv("error", ex.what())});
        }
    });
    logging::info("Voice session ended", {kv("voice_session_id", session_id)});
}

void SessionRecorder::drain() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_worker_ = true;
    }
    queue_cv_.notify_one();
    if (worker_.joinable()) {
        worker_.join();
    }
}

bool SessionRecorder::started() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return record_.has_value();
}

std::string SessionRecorder::session_id() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return record_ ? record_->id : std::string();
}

void SessionRecorder::enqueue(Task task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stop_worker_) {
            logging::warn("Recorder already drained, dropping write");
            return;
        }
        tasks_.push_back(std::move(task));
    }
    queue_cv_.notify_one();
}

void SessionRecorder::worker_loop() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this]() { return stop_worker_ || !tasks_.empty(); });
            if (stop_worker_ && tasks_.empty()) {
                break;
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        try {
            task();
        } catch (const std::exception& ex) {
            logging::error("Recorder task failed", {kv("error", ex.what())});
        }
    }
}

// Caller holds state_mutex_.
std::string SessionRecorder::next_timestamp() {
    auto now = std::chrono::system_clock::now();
    if (now <= last_timestamp_) {
        now = last_timestamp_ + std::chrono::microseconds(1);
    }
    last_timestamp_ = now;
    return utils::format_utc(now);
}

void SessionRecorder::mirror_line(const std::string& sender_id, const std::string& text,
                                  const std::string& created_at) {
    ChatMirror mirror;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        mirror = mirror_;
    }
    try {
        if (!resolved_conversation_) {
            if (mirror.conversation_id) {
                resolved_conversation_ = *mirror.conversation_id;
            } else if (mirror.customer_id) {
                resolved_conversation_ =
                    store_.find_or_create_conversation(*mirror.customer_id, created_at);
            } else {
                return;
            }
        }
        persistence::ChatMessageRecord message{utils::generate_uuid_v4(), *resolved_conversation_,
                                               sender_id, text, created_at};
        store_.insert_chat_message(message);
        store_.touch_conversation(*resolved_conversation_, created_at);
    } catch (const PersistenceError& ex) {
        logging::warn("Failed to mirror transcript to chat", {kv("error", ex.what())});
    }
}

}
}
