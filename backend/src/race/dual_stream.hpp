#pragma once
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// The two observation channels a dual-stream endpoint offers for one event.
enum class StreamSlot : uint8_t {
    Account     = 0, // account-write notification carrying the txn signature
    Transaction = 1
};

const char* to_string(StreamSlot slot);

struct DualStreamRecord {
    std::string signature;
    std::optional<double> account_ts;
    std::string account_endpoint;
    std::optional<double> transaction_ts;
    std::string transaction_endpoint;

    bool complete() const { return account_ts.has_value() && transaction_ts.has_value(); }

    // transaction minus account, milliseconds. Only meaningful when complete().
    double delta_ms() const { return (*transaction_ts - *account_ts) * 1000.0; }
};

// One dual-stream runner's own view. Single writer, no locking.
// The first local sighting of a slot wins; later ones are ignored.
class LocalDualStreamView {
public:
    struct Update {
        const DualStreamRecord* record{nullptr};
        bool slot_set{false};     // this call filled the slot
        bool became_complete{false}; // this call filled the second slot
    };

    explicit LocalDualStreamView(std::string endpoint) : endpoint_(std::move(endpoint)) {}

    Update record(StreamSlot slot, const std::string& signature, double timestamp);

    const DualStreamRecord* find(const std::string& signature) const;
    std::vector<DualStreamRecord> snapshot() const;
    std::size_t size() const noexcept { return records_.size(); }
    const std::string& endpoint() const noexcept { return endpoint_; }

private:
    std::string endpoint_;
    std::unordered_map<std::string, DualStreamRecord> records_;
};

// Cross-endpoint dual-stream registry shared by every dual-stream runner.
// Each slot converges to the earliest observation from any endpoint, whatever
// order the runner threads interleave in.
class GlobalDualStreamTracker {
public:
    // Returns true when this observation became the slot's new minimum.
    bool merge(StreamSlot slot, const std::string& endpoint,
               const std::string& signature, double timestamp);

    std::optional<DualStreamRecord> find(const std::string& signature) const;

    // Read by the reporter after every writer has joined.
    std::vector<DualStreamRecord> snapshot() const;
    std::size_t size() const;

private:
    mutable std::mutex m_;
    std::unordered_map<std::string, DualStreamRecord> records_;
};
