#pragma once

#include <atomic>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace voice_bridge {
namespace utils {

// Owns one thread per spawned task and joins them all before it goes away.
// An escaping exception is logged under the task label instead of
// terminating the process.
class TaskGroup {
public:
    TaskGroup() = default;
    ~TaskGroup();

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    void spawn(const std::string& label, std::function<void()> task);

    // Blocks until every spawned task has returned.
    void join_all();

    // Tasks spawned and not yet finished.
    size_t running() const;

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void reap_finished();

    mutable std::mutex mutex_;
    std::list<Worker> workers_;
};

}
}
