#pragma once
#include "stream/stream_protocol.hpp"

#include <simdjson.h>
#include <string>
#include <vector>

// Shredstream proxy entries feed. The subscription carries no filter; every
// transaction in the decoded entries is reported and the runner filters on
// the watched account itself.
class ShredstreamProtocol : public IStreamProtocol {
public:
    ShredstreamProtocol() = default;

    std::string subscribe_request(const RunConfig&) const override { return "{}"; }
    std::string ping_reply() const override { return {}; }
    bool dual_stream() const override { return false; }
    bool parse(const std::string& raw, std::vector<StreamUpdate>& out) override;

private:
    simdjson::ondemand::parser parser_;
};
