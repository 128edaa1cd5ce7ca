#pragma once
#include "stream/stream_protocol.hpp"

#include <simdjson.h>
#include <string>
#include <vector>

// Yellowstone Geyser over its JSON gateway (proto3 JSON mapping: bytes are
// base64, uint64 are strings, field names are lowerCamelCase).
class YellowstoneProtocol : public IStreamProtocol {
public:
    explicit YellowstoneProtocol(bool include_accounts) : include_accounts_(include_accounts) {}

    std::string subscribe_request(const RunConfig& cfg) const override;
    std::string ping_reply() const override { return R"({"ping":{"id":1}})"; }
    bool dual_stream() const override { return include_accounts_; }
    bool parse(const std::string& raw, std::vector<StreamUpdate>& out) override;

private:
    bool parse_transaction(simdjson::ondemand::object& update, StreamUpdate& up);
    bool parse_transaction_info(simdjson::ondemand::object& info, StreamUpdate& up);
    bool parse_account(simdjson::ondemand::object& update, StreamUpdate& up);

    bool include_accounts_;
    simdjson::ondemand::parser parser_;
};
