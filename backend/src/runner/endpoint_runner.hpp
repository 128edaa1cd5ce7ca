#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config/run_config.hpp"
#include "race/comparator.hpp"
#include "race/dual_stream.hpp"
#include "race/race_stats.hpp"
#include "race/shutdown_signal.hpp"
#include "stream/stream_connector.hpp"
#include "stream/stream_protocol.hpp"
#include "util/race_log.hpp"

enum class RunnerState : uint8_t {
    Connecting        = 0,
    Subscribed        = 1,
    Streaming         = 2,
    ShutdownRequested = 3,
    StreamClosed      = 4,
    StreamError       = 5,
    Terminated        = 6
};

const char* to_string(RunnerState s);

// Shared state every runner of one session writes into.
struct RaceContext {
    const RunConfig& config;
    Comparator& comparator;
    GlobalDualStreamTracker& dual_tracker;
    ShutdownSignal& shutdown;
    double start_time{0};
};

struct RunnerSummary {
    std::string endpoint;
    RunnerState end_state{RunnerState::Terminated}; // how streaming ended
    std::string end_reason;
    std::size_t transactions{0};    // matching transactions raced
    std::size_t account_updates{0};
    std::size_t decode_failures{0};
    std::size_t pings{0};
    bool triggered_shutdown{false}; // this runner's add reached the target
    std::optional<DualStreamReport> local_dual;
};

// Drives one endpoint: connect, subscribe, stream and feed every matching
// observation into the session registries until shutdown or stream end.
class EndpointRunner {
public:
    EndpointRunner(Endpoint endpoint,
                   std::unique_ptr<IStreamConnector> connector,
                   std::unique_ptr<IStreamProtocol> protocol,
                   std::unique_ptr<RaceLog> log,
                   RaceContext ctx);

    EndpointRunner(const EndpointRunner&) = delete;
    EndpointRunner& operator=(const EndpointRunner&) = delete;

    // Blocks until the stream ends. Throws ConnectError, SubscribeError or
    // LogWriteError; stream-level failures end in the summary instead.
    RunnerSummary run();

    RunnerState state() const noexcept { return state_.load(std::memory_order_acquire); }
    const std::string& name() const noexcept { return endpoint_.name; }

private:
    void on_frame(const std::string& raw);
    void on_transaction(const StreamUpdate& up);
    void on_account(const StreamUpdate& up);
    void report_lead_lag(const DualStreamRecord& rec);
    void on_target_reached(std::size_t valid_count);
    void set_state(RunnerState s) noexcept { state_.store(s, std::memory_order_release); }

    Endpoint endpoint_;
    std::unique_ptr<IStreamConnector> connector_;
    std::unique_ptr<IStreamProtocol> protocol_;
    std::unique_ptr<RaceLog> log_;
    RaceContext ctx_;

    std::string tx_label_;
    std::string acct_label_;
    std::optional<LocalDualStreamView> local_;

    std::vector<StreamUpdate> updates_;
    std::atomic<RunnerState> state_{RunnerState::Connecting};
    bool stop_requested_{false};
    RunnerSummary summary_;
};
