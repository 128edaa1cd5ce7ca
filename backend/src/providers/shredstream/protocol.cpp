#include "protocol.hpp"

#include <utility>

#include "codec/base64.hpp"
#include "entry_decoder.hpp"
#include "stream/stream_errors.hpp"
#include "util/log.hpp"

bool ShredstreamProtocol::parse(const std::string& raw, std::vector<StreamUpdate>& out) {
    simdjson::padded_string pj(raw);
    auto doc_res = parser_.iterate(pj);
    if (auto err = doc_res.error()) {
        log_debug("[shredstream-parser] iterate error: ", simdjson::error_message(err));
        return false;
    }
    simdjson::ondemand::document doc = std::move(doc_res.value());

    simdjson::ondemand::object root;
    if (auto err = doc.get_object().get(root)) {
        log_debug("[shredstream-parser] root get_object error: ", simdjson::error_message(err));
        return false;
    }

    std::uint64_t slot = 0;
    std::string entries;
    bool have_entries = false;

    for (auto field_res : root) {
        simdjson::ondemand::field field;
        if (std::move(field_res).get(field)) return false;
        std::string_view key;
        if (field.unescaped_key().get(key)) return false;

        if (key == "slot") {
            simdjson::ondemand::value& v = field.value();
            simdjson::ondemand::json_type t;
            if (v.type().get(t)) return false;
            auto err = (t == simdjson::ondemand::json_type::string) ? v.get_uint64_in_string().get(slot)
                                                                    : v.get_uint64().get(slot);
            if (err) return false;
        } else if (key == "entries") {
            std::string_view b64;
            if (field.value().get_string().get(b64)) return false;
            auto bytes = base64_decode(b64);
            if (!bytes) {
                log_debug("[shredstream-parser] entries field is not base64");
                return false;
            }
            entries = std::move(*bytes);
            have_entries = true;
        }
    }

    if (!have_entries) {
        StreamUpdate up;
        up.kind = UpdateKind::Other;
        up.detail = "entry without payload";
        out.push_back(std::move(up));
        return true;
    }

    std::vector<DecodedTransaction> txs;
    try {
        txs = decode_entries(entries);
    } catch (const DecodeError& e) {
        log_debug("[shredstream-parser] slot ", slot, " entry decode error: ", e.what());
        return false;
    }

    for (auto& tx : txs) {
        StreamUpdate up;
        up.kind = UpdateKind::Transaction;
        up.signature = std::move(tx.signature);
        up.account_keys = std::move(tx.account_keys);
        up.slot = slot;
        out.push_back(std::move(up));
    }
    return true;
}
