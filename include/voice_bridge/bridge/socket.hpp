#pragma once

#include <optional>
#include <string>

namespace voice_bridge {
namespace bridge {

// Text-framed WebSocket connection as seen by a bridge.
class MediaSocket {
public:
    virtual ~MediaSocket() = default;

    // Blocks for the next text frame. Returns nullopt once the peer has gone
    // or interrupt() was called.
    virtual std::optional<std::string> receive() = 0;

    // Safe to call from both loops. Throws TransportError when the
    // connection can no longer carry frames.
    virtual void send_text(const std::string& payload) = 0;

    // Unblocks receive() without closing the connection.
    virtual void interrupt() = 0;

    virtual void close(int code, const std::string& reason) = 0;
};

}
}
