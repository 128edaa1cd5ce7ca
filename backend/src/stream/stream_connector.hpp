#pragma once
#include <cstdint>
#include <functional>
#include <string>

// How a connector's read loop ended.
enum class StreamEnd : uint8_t {
    Shutdown = 0, // close() was requested
    Closed   = 1, // provider closed the stream
    Error    = 2  // transport or provider error
};

inline const char* to_string(StreamEnd end) {
    switch (end) {
        case StreamEnd::Shutdown: return "shutdown";
        case StreamEnd::Closed:   return "closed";
        case StreamEnd::Error:    return "error";
    }
    return "unknown";
}

struct StreamResult {
    StreamEnd end{StreamEnd::Closed};
    std::string reason;
};

// Interface for a streaming provider connection.
// connect() and subscribe() block; run() drives the read loop on the calling
// thread, invoking on_frame for each text frame until close(), remote close
// or error. close() is safe from any thread and aborts a pending read.
struct IStreamConnector {
    using OnFrame = std::function<void(const std::string&)>;
    virtual ~IStreamConnector() = default;

    virtual void connect() = 0;                              // throws ConnectError
    virtual void subscribe(const std::string& request) = 0;  // throws SubscribeError
    virtual StreamResult run(OnFrame on_frame) = 0;

    // Only from inside on_frame. Throws StreamError.
    virtual void send(const std::string& text) = 0;

    virtual void close() noexcept = 0;
};
