#pragma once
#include <string>
#include <vector>

#include "stream_update.hpp"

struct RunConfig;

// Provider-specific half of an endpoint runner: the subscription request
// shape and the frame -> update mapping. Everything else is shared.
struct IStreamProtocol {
    virtual ~IStreamProtocol() = default;

    virtual std::string subscribe_request(const RunConfig& cfg) const = 0;

    // Reply for UpdateKind::Ping, sent on the subscription channel.
    virtual std::string ping_reply() const = 0;

    // Also watches account-write notifications for the same account.
    virtual bool dual_stream() const = 0;

    // Parse one text frame into zero or more updates.
    // Returns false when the payload could not be decoded.
    virtual bool parse(const std::string& raw, std::vector<StreamUpdate>& out) = 0;
};
