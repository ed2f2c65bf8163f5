#include "voice_bridge/bridge/duplex.hpp"

#include <condition_variable>
#include <exception>
#include <mutex>
#include <thread>

#include "voice_bridge/logging.hpp"

namespace voice_bridge {
namespace bridge {

void run_duplex(const std::function<void()>& inbound,
                const std::function<void()>& outbound,
                const std::function<void()>& cancel) {
    std::mutex mutex;
    std::condition_variable cv;
    bool finished = false;
    std::exception_ptr first_error;

    auto run_loop = [&](const std::function<void()>& loop, const char* name) {
        std::exception_ptr error;
        try {
            loop();
        } catch (...) {
            error = std::current_exception();
        }
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!finished) {
                finished = true;
                first_error = error;
                logging::debug("Duplex loop finished first", {kv("loop", name)});
            }
        }
        cv.notify_all();
    };

    std::thread inbound_thread([&]() { run_loop(inbound, "inbound"); });
    std::thread outbound_thread([&]() { run_loop(outbound, "outbound"); });

    {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock, [&]() { return finished; });
    }

    try {
        cancel();
    } catch (const std::exception& ex) {
        logging::warn("Duplex cancel failed", {kv("error", ex.what())});
    }

    inbound_thread.join();
    outbound_thread.join();

    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

}
}
