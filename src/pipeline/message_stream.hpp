#pragma once

#include <memory>
#include <string>

namespace optick {

// One bidirectional message connection, read by a single thread.
class MessageStream {
public:
    virtual ~MessageStream() = default;

    // Throws ConnectionError.
    virtual void send_binary(const std::string& payload) = 0;

    // Blocks for the next message. Returns false once the connection has
    // been closed cleanly (by either side). Throws ConnectionError.
    virtual bool read(std::string& out) = 0;

    // May be called from any thread. A blocked read() then returns false.
    virtual void shutdown() = 0;
};

struct StreamOptions {
    bool verify_peer = true;
    std::string user_agent = "optick/1.0";
};

// Connects a websocket to ws:// or wss:// `url`. Throws ConnectionError.
std::unique_ptr<MessageStream> open_websocket(const std::string& url,
                                              const StreamOptions& opts = StreamOptions());

} // namespace optick
