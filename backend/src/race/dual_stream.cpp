#include "dual_stream.hpp"

const char* to_string(StreamSlot slot) {
    switch (slot) {
        case StreamSlot::Account:     return "account";
        case StreamSlot::Transaction: return "transaction";
    }
    return "unknown";
}

namespace {

std::optional<double>& slot_ts(DualStreamRecord& r, StreamSlot slot) {
    return slot == StreamSlot::Account ? r.account_ts : r.transaction_ts;
}

std::string& slot_endpoint(DualStreamRecord& r, StreamSlot slot) {
    return slot == StreamSlot::Account ? r.account_endpoint : r.transaction_endpoint;
}

DualStreamRecord& entry_for(std::unordered_map<std::string, DualStreamRecord>& m,
                            const std::string& signature) {
    auto [it, inserted] = m.try_emplace(signature);
    if (inserted) it->second.signature = signature;
    return it->second;
}

} // namespace

LocalDualStreamView::Update LocalDualStreamView::record(StreamSlot slot,
                                                        const std::string& signature,
                                                        double timestamp) {
    DualStreamRecord& rec = entry_for(records_, signature);
    Update up;
    up.record = &rec;

    auto& ts = slot_ts(rec, slot);
    if (!ts) {
        ts = timestamp;
        slot_endpoint(rec, slot) = endpoint_;
        up.slot_set = true;
        up.became_complete = rec.complete();
    }
    return up;
}

const DualStreamRecord* LocalDualStreamView::find(const std::string& signature) const {
    auto it = records_.find(signature);
    return it == records_.end() ? nullptr : &it->second;
}

std::vector<DualStreamRecord> LocalDualStreamView::snapshot() const {
    std::vector<DualStreamRecord> out;
    out.reserve(records_.size());
    for (const auto& kv : records_) out.push_back(kv.second);
    return out;
}

bool GlobalDualStreamTracker::merge(StreamSlot slot, const std::string& endpoint,
                                    const std::string& signature, double timestamp) {
    std::lock_guard<std::mutex> lk(m_);
    DualStreamRecord& rec = entry_for(records_, signature);

    auto& ts = slot_ts(rec, slot);
    if (ts && !(timestamp < *ts)) return false;
    ts = timestamp;
    slot_endpoint(rec, slot) = endpoint;
    return true;
}

std::optional<DualStreamRecord> GlobalDualStreamTracker::find(const std::string& signature) const {
    std::lock_guard<std::mutex> lk(m_);
    auto it = records_.find(signature);
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

std::vector<DualStreamRecord> GlobalDualStreamTracker::snapshot() const {
    std::lock_guard<std::mutex> lk(m_);
    std::vector<DualStreamRecord> out;
    out.reserve(records_.size());
    for (const auto& kv : records_) out.push_back(kv.second);
    return out;
}

std::size_t GlobalDualStreamTracker::size() const {
    std::lock_guard<std::mutex> lk(m_);
    return records_.size();
}
