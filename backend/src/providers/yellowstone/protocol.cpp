#include "protocol.hpp"

#include <cctype>
#include <sstream>
#include <utility>

#include "codec/base58.hpp"
#include "codec/base64.hpp"
#include "config/run_config.hpp"
#include "util/json_encode.hpp"
#include "util/log.hpp"

namespace {

bool read_u64(simdjson::ondemand::value& v, std::uint64_t& out) {
    simdjson::ondemand::json_type t;
    if (v.type().get(t)) return false;
    if (t == simdjson::ondemand::json_type::string) return !v.get_uint64_in_string().get(out);
    return !v.get_uint64().get(out);
}

// base64 bytes field -> base58 text
bool read_key(simdjson::ondemand::value& v, std::string& out) {
    std::string_view sv;
    if (v.get_string().get(sv)) return false;
    auto bytes = base64_decode(sv);
    if (!bytes) return false;
    out = base58_encode(*bytes);
    return true;
}

bool is_null(simdjson::ondemand::value& v) {
    simdjson::ondemand::json_type t;
    return !v.type().get(t) && t == simdjson::ondemand::json_type::null;
}

std::string upper(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

} // namespace

std::string YellowstoneProtocol::subscribe_request(const RunConfig& cfg) const {
    const std::string account = json_escape(cfg.account);
    std::ostringstream os;
    os << R"({"transactions":{"account":{"accountInclude":[")" << account
       << R"("],"accountExclude":[],"accountRequired":[]}})";
    if (include_accounts_) {
        os << R"(,"accounts":{"account":{"account":[")" << account
           << R"("],"owner":[],"filters":[]}})";
    }
    os << R"(,"commitment":")" << upper(to_string(cfg.commitment)) << R"("})";
    return os.str();
}

bool YellowstoneProtocol::parse(const std::string& raw, std::vector<StreamUpdate>& out) {
    simdjson::padded_string pj(raw);
    auto doc_res = parser_.iterate(pj);
    if (auto err = doc_res.error()) {
        log_debug("[yellowstone-parser] iterate error: ", simdjson::error_message(err));
        return false;
    }
    simdjson::ondemand::document doc = std::move(doc_res.value());

    simdjson::ondemand::object root;
    if (auto err = doc.get_object().get(root)) {
        log_debug("[yellowstone-parser] root get_object error: ", simdjson::error_message(err));
        return false;
    }

    for (auto field_res : root) {
        simdjson::ondemand::field field;
        if (std::move(field_res).get(field)) return false;
        std::string_view key;
        if (field.unescaped_key().get(key)) return false;
        if (key == "filters" || key == "createdAt") continue;

        StreamUpdate up;
        if (key == "transaction") {
            simdjson::ondemand::object obj;
            if (field.value().get_object().get(obj)) return false;
            if (!parse_transaction(obj, up)) return false;
        } else if (key == "account") {
            simdjson::ondemand::object obj;
            if (field.value().get_object().get(obj)) return false;
            if (!parse_account(obj, up)) return false;
        } else if (key == "ping") {
            up.kind = UpdateKind::Ping;
        } else if (key == "error") {
            up.kind = UpdateKind::Error;
            simdjson::ondemand::value& v = field.value();
            simdjson::ondemand::json_type t;
            std::string_view msg;
            if (!v.type().get(t) && t == simdjson::ondemand::json_type::string && !v.get_string().get(msg)) {
                up.detail = std::string(msg);
            } else if (!v.type().get(t) && t == simdjson::ondemand::json_type::object &&
                       !v["message"].get_string().get(msg)) {
                up.detail = std::string(msg);
            } else {
                up.detail = "provider error";
            }
        } else {
            up.kind = UpdateKind::Other;
            up.detail = std::string(key);
        }
        out.push_back(std::move(up));
    }
    return true;
}

bool YellowstoneProtocol::parse_transaction(simdjson::ondemand::object& update, StreamUpdate& up) {
    up.kind = UpdateKind::Transaction;
    for (auto field_res : update) {
        simdjson::ondemand::field field;
        if (std::move(field_res).get(field)) return false;
        std::string_view key;
        if (field.unescaped_key().get(key)) return false;

        if (key == "slot") {
            if (!read_u64(field.value(), up.slot)) return false;
        } else if (key == "transaction") {
            simdjson::ondemand::object info;
            if (field.value().get_object().get(info)) return false;
            if (!parse_transaction_info(info, up)) return false;
        }
    }
    return !up.signature.empty();
}

bool YellowstoneProtocol::parse_transaction_info(simdjson::ondemand::object& info, StreamUpdate& up) {
    for (auto field_res : info) {
        simdjson::ondemand::field field;
        if (std::move(field_res).get(field)) return false;
        std::string_view key;
        if (field.unescaped_key().get(key)) return false;

        if (key == "signature") {
            if (!read_key(field.value(), up.signature)) return false;
        } else if (key == "transaction") {
            simdjson::ondemand::object tx;
            if (field.value().get_object().get(tx)) return false;
            for (auto tx_field_res : tx) {
                simdjson::ondemand::field tx_field;
                if (std::move(tx_field_res).get(tx_field)) return false;
                std::string_view tx_key;
                if (tx_field.unescaped_key().get(tx_key)) return false;

                if (tx_key == "signatures") {
                    simdjson::ondemand::array sigs;
                    if (tx_field.value().get_array().get(sigs)) return false;
                    for (auto sig_res : sigs) {
                        simdjson::ondemand::value sig;
                        if (sig_res.get(sig)) return false;
                        std::string first;
                        if (!read_key(sig, first)) return false;
                        if (up.signature.empty()) up.signature = std::move(first);
                    }
                } else if (tx_key == "message") {
                    simdjson::ondemand::object msg;
                    if (tx_field.value().get_object().get(msg)) return false;
                    simdjson::ondemand::array keys;
                    if (msg["accountKeys"].get_array().get(keys)) return false;
                    for (auto key_res : keys) {
                        simdjson::ondemand::value k;
                        if (key_res.get(k)) return false;
                        std::string pubkey;
                        if (!read_key(k, pubkey)) return false;
                        up.account_keys.push_back(std::move(pubkey));
                    }
                }
            }
        }
    }
    return true;
}

bool YellowstoneProtocol::parse_account(simdjson::ondemand::object& update, StreamUpdate& up) {
    up.kind = UpdateKind::Account;
    for (auto field_res : update) {
        simdjson::ondemand::field field;
        if (std::move(field_res).get(field)) return false;
        std::string_view key;
        if (field.unescaped_key().get(key)) return false;

        if (key == "slot") {
            if (!read_u64(field.value(), up.slot)) return false;
        } else if (key == "account") {
            simdjson::ondemand::object info;
            if (field.value().get_object().get(info)) return false;
            for (auto info_res : info) {
                simdjson::ondemand::field info_field;
                if (std::move(info_res).get(info_field)) return false;
                std::string_view info_key;
                if (info_field.unescaped_key().get(info_key)) return false;

                if (info_key == "pubkey") {
                    if (!read_key(info_field.value(), up.account)) return false;
                } else if (info_key == "txnSignature") {
                    if (is_null(info_field.value())) continue;
                    if (!read_key(info_field.value(), up.signature)) return false;
                }
            }
        }
    }
    return true;
}
