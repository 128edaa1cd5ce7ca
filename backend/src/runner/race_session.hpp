#pragma once
#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "config/run_config.hpp"
#include "endpoint_runner.hpp"
#include "race/comparator.hpp"
#include "race/dual_stream.hpp"
#include "race/run_latch.hpp"
#include "race/session_report.hpp"
#include "race/shutdown_signal.hpp"
#include "stream/stream_connector.hpp"

// One race across every configured endpoint. Owns the shared registries,
// runs each endpoint on its own thread and builds the report once the last
// runner is done.
class RaceSession {
public:
    using ConnectorFactory = std::function<std::unique_ptr<IStreamConnector>(const Endpoint&)>;

    struct EndpointOutcome {
        std::string endpoint;
        bool ok{false};
        std::string error;                   // set when !ok
        std::optional<RunnerSummary> summary; // set when ok
    };

    explicit RaceSession(RunConfig cfg);
    RaceSession(RunConfig cfg, ConnectorFactory make_connector);
    ~RaceSession();

    RaceSession(const RaceSession&) = delete;
    RaceSession& operator=(const RaceSession&) = delete;

    void start();

    // Joins every runner. Outcomes follow the configured endpoint order.
    std::vector<EndpointOutcome> wait();

    // External stop (signal handler); safe from any thread, idempotent.
    void request_shutdown();

    // True once every runner is terminal and the report is built.
    bool finished() const noexcept { return finished_.load(std::memory_order_acquire); }
    std::optional<SessionReport> report() const;

    const RunConfig& config() const noexcept { return cfg_; }
    const Comparator& comparator() const noexcept { return comparator_; }
    const GlobalDualStreamTracker& dual_tracker() const noexcept { return dual_tracker_; }
    bool dual_stream() const noexcept { return dual_stream_; }
    double start_time() const noexcept { return start_time_; }

private:
    RunnerSummary run_endpoint(const Endpoint& ep);
    void on_runner_done();
    void build_report();

    RunConfig cfg_;
    ConnectorFactory make_connector_;

    Comparator comparator_;
    GlobalDualStreamTracker dual_tracker_;
    ShutdownSignal shutdown_;
    RunLatch latch_;
    bool dual_stream_{false};
    double start_time_{0};

    std::vector<std::thread> threads_;
    std::vector<std::future<RunnerSummary>> futures_;

    mutable std::mutex report_m_;
    std::optional<SessionReport> report_;
    std::atomic<bool> finished_{false};
};
