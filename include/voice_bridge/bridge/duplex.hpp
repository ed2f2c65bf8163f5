#pragma once

#include <functional>

namespace voice_bridge {
namespace bridge {

// Runs both loops on their own threads. When the first one returns or throws,
// cancel() is invoked so the other one unblocks; both are joined before this
// returns. The exception of the loop that finished first is rethrown.
void run_duplex(const std::function<void()>& inbound,
                const std::function<void()>& outbound,
                const std::function<void()>& cancel);

}
}
