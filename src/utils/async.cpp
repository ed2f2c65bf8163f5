#include "voice_bridge/utils/async.hpp"

#include <exception>
#include <utility>

#include "voice_bridge/logging.hpp"

namespace voice_bridge::utils {

TaskGroup::~TaskGroup() {
    join_all();
}

void TaskGroup::spawn(const std::string& label, std::function<void()> task) {
    reap_finished();
    auto done = std::make_shared<std::atomic<bool>>(false);
    std::thread worker([label, done, task = std::move(task)]() {
        try {
            task();
        } catch (const std::exception& ex) {
            logging::error("Task failed", {kv("task", label), kv("error", ex.what())});
        }
        done->store(true);
    });
    std::lock_guard<std::mutex> lock(mutex_);
    workers_.push_back(Worker{std::move(worker), std::move(done)});
}

void TaskGroup::join_all() {
    for (;;) {
        std::list<Worker> workers;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            workers.swap(workers_);
        }
        if (workers.empty()) {
            return;
        }
        for (auto& worker : workers) {
            worker.thread.join();
        }
    }
}

size_t TaskGroup::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& worker : workers_) {
        if (!worker.done->load()) {
            ++count;
        }
    }
    return count;
}

void TaskGroup::reap_finished() {
    std::list<Worker> finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (it->done->load()) {
                finished.splice(finished.end(), workers_, it++);
            } else {
                ++it;
            }
        }
    }
    for (auto& worker : finished) {
        worker.thread.join();
    }
}

}
