#include "race_session.hpp"

#include <sstream>
#include <stdexcept>

#include "providers/provider_registry.hpp"
#include "race/race_stats.hpp"
#include "stream/geyser_ws.hpp"
#include "util/clock.hpp"
#include "util/log.hpp"
#include "util/race_log.hpp"

namespace {

std::unique_ptr<IStreamConnector> make_geyser_ws(const Endpoint& ep) {
    return std::make_unique<GeyserWs>(ep.url, ep.x_token);
}

} // namespace

RaceSession::RaceSession(RunConfig cfg)
    : RaceSession(std::move(cfg), make_geyser_ws) {}

RaceSession::RaceSession(RunConfig cfg, ConnectorFactory make_connector)
    : cfg_(std::move(cfg)),
      make_connector_(std::move(make_connector)),
      latch_(cfg_.endpoints.size()) {
    for (const auto& ep : cfg_.endpoints) {
        const ProviderFactory* factory = ProviderRegistry::instance().find(ep.provider);
        if (factory && factory->dual_stream) dual_stream_ = true;
    }
}

RaceSession::~RaceSession() {
    bool running = false;
    for (const auto& t : threads_) running = running || t.joinable();
    if (!running) return;

    request_shutdown();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
}

void RaceSession::start() {
    if (!threads_.empty()) {
        throw std::logic_error("RaceSession already started");
    }
    start_time_ = now_seconds();
    log_info("[session] Racing ", cfg_.transactions, " transactions for account ", cfg_.account,
             " across ", cfg_.endpoints.size(), " endpoints");

    threads_.reserve(cfg_.endpoints.size());
    futures_.reserve(cfg_.endpoints.size());
    for (const auto& ep : cfg_.endpoints) {
        std::packaged_task<RunnerSummary()> task([this, ep] { return run_endpoint(ep); });
        futures_.push_back(task.get_future());
        threads_.emplace_back(std::move(task));
    }
}

std::vector<RaceSession::EndpointOutcome> RaceSession::wait() {
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }

    std::vector<EndpointOutcome> outcomes;
    outcomes.reserve(futures_.size());
    for (std::size_t i = 0; i < futures_.size(); ++i) {
        EndpointOutcome out;
        out.endpoint = cfg_.endpoints[i].name;
        if (!futures_[i].valid()) {
            out.error = "outcome already collected";
            outcomes.push_back(std::move(out));
            continue;
        }
        try {
            out.summary = futures_[i].get();
            out.ok = true;
        } catch (const std::exception& e) {
            out.error = e.what();
        }
        outcomes.push_back(std::move(out));
    }
    return outcomes;
}

void RaceSession::request_shutdown() {
    if (shutdown_.trigger()) {
        log_info("[session] Shutdown requested");
    }
}

std::optional<SessionReport> RaceSession::report() const {
    std::lock_guard<std::mutex> lk(report_m_);
    return report_;
}

RunnerSummary RaceSession::run_endpoint(const Endpoint& ep) {
    // Every exit path, fatal or not, counts towards the latch.
    struct Arrival {
        RaceSession* session;
        ~Arrival() { session->on_runner_done(); }
    } arrival{this};

    try {
        const ProviderFactory* factory = ProviderRegistry::instance().find(ep.provider);
        if (!factory) {
            throw std::runtime_error("unknown provider '" + ep.provider + "'");
        }
        auto log = std::make_unique<RaceLog>(cfg_.log_dir, ep.name + factory->log_suffix);
        EndpointRunner runner(ep, make_connector_(ep), factory->make_protocol(), std::move(log),
                              RaceContext{cfg_, comparator_, dual_tracker_, shutdown_, start_time_});
        return runner.run();
    } catch (const std::exception& e) {
        log_error("[", ep.name, "] Endpoint failed: ", e.what());
        throw;
    }
}

void RaceSession::on_runner_done() {
    if (!latch_.arrive()) {
        log_debug("[session] Runner finished, ", latch_.arrived(), " of ", latch_.expected(), " done");
        return;
    }
    try {
        build_report();
    } catch (const std::exception& e) {
        log_error("[session] Failed to build report: ", e.what());
    }
    finished_.store(true, std::memory_order_release);
}

void RaceSession::build_report() {
    SessionReport r;
    r.races = summarize_races(comparator_.records());
    r.dual_stream = dual_stream_;
    if (dual_stream_) {
        r.dual = summarize_dual_stream(dual_tracker_.snapshot());
    }

    std::ostringstream os;
    print_session_report(os, r);
    log_info(os.str());

    std::lock_guard<std::mutex> lk(report_m_);
    report_ = std::move(r);
}
