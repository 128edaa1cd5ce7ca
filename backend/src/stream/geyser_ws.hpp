#pragma once
#include <string>

#include "stream/stream_connector.hpp"

// WebSocket connector for streaming providers (wss:// or ws:// URLs).
// Sends the endpoint's auth token as an `x-token` handshake header.
// NOTE: uses a PIMPL to hide Boost headers from dependents.
class GeyserWs final : public IStreamConnector {
public:
    GeyserWs(std::string url, std::string x_token);
    ~GeyserWs() override;
    GeyserWs(const GeyserWs&) = delete;
    GeyserWs& operator=(const GeyserWs&) = delete;

    void connect() override;
    void subscribe(const std::string& request) override;
    StreamResult run(OnFrame on_frame) override; // blocks until the stream ends
    void send(const std::string& text) override;
    void close() noexcept override;              // thread-safe, aborts a pending read

private:
    struct Impl;
    Impl* impl_;
};
