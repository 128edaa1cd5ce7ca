#include "endpoint_runner.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

#include "stream/stream_errors.hpp"
#include "util/clock.hpp"
#include "util/log.hpp"

namespace {

constexpr std::size_t kLoggedAccountUpdates = 10;

std::string short_id(const std::string& s) {
    return s.size() > 8 ? s.substr(0, 8) : s;
}

} // namespace

const char* to_string(RunnerState s) {
    switch (s) {
        case RunnerState::Connecting:        return "connecting";
        case RunnerState::Subscribed:        return "subscribed";
        case RunnerState::Streaming:         return "streaming";
        case RunnerState::ShutdownRequested: return "shutdown_requested";
        case RunnerState::StreamClosed:      return "stream_closed";
        case RunnerState::StreamError:       return "stream_error";
        case RunnerState::Terminated:        return "terminated";
    }
    return "unknown";
}

EndpointRunner::EndpointRunner(Endpoint endpoint,
                               std::unique_ptr<IStreamConnector> connector,
                               std::unique_ptr<IStreamProtocol> protocol,
                               std::unique_ptr<RaceLog> log,
                               RaceContext ctx)
    : endpoint_(std::move(endpoint)),
      connector_(std::move(connector)),
      protocol_(std::move(protocol)),
      log_(std::move(log)),
      ctx_(ctx) {
    if (protocol_->dual_stream()) {
        tx_label_   = endpoint_.name + "_TX";
        acct_label_ = endpoint_.name + "_ACCT";
        local_.emplace(endpoint_.name);
    } else {
        tx_label_ = endpoint_.name;
    }
}

RunnerSummary EndpointRunner::run() {
    summary_ = RunnerSummary{};
    summary_.endpoint = endpoint_.name;
    set_state(RunnerState::Connecting);

    // Registered before connecting so a concurrent stop is never missed.
    IStreamConnector* conn = connector_.get();
    auto subscription = ctx_.shutdown.subscribe([conn] { conn->close(); });

    if (ctx_.shutdown.triggered()) {
        log_info("[", endpoint_.name, "] Shutdown already requested; not connecting");
        summary_.end_state = RunnerState::ShutdownRequested;
        set_state(RunnerState::Terminated);
        return summary_;
    }

    log_info("[", endpoint_.name, "] Connecting to endpoint: ", endpoint_.url);
    connector_->connect();
    log_info("[", endpoint_.name, "] Connected successfully");

    set_state(RunnerState::Subscribed);
    const std::string request = protocol_->subscribe_request(ctx_.config);
    log_debug("[", endpoint_.name, "] Subscribe request: ", request);
    connector_->subscribe(request);
    if (endpoint_.provider == "shredstream") {
        log_info("[", endpoint_.name, "] Subscribed to entries, filtering on account ", ctx_.config.account);
    } else {
        log_info("[", endpoint_.name, "] Subscribed to ",
                 local_ ? "transactions and account updates" : "transactions",
                 " for account ", ctx_.config.account,
                 " with commitment ", to_string(ctx_.config.commitment));
    }

    set_state(RunnerState::Streaming);
    const StreamResult result = connector_->run([this](const std::string& raw) { on_frame(raw); });

    switch (result.end) {
        case StreamEnd::Shutdown:
            log_info("[", endpoint_.name, "] Received stop signal, shutting down stream");
            set_state(RunnerState::ShutdownRequested);
            break;
        case StreamEnd::Closed:
            log_info("[", endpoint_.name, "] Stream closed by provider",
                     result.reason.empty() ? "" : ": ", result.reason);
            set_state(RunnerState::StreamClosed);
            break;
        case StreamEnd::Error:
            log_error("[", endpoint_.name, "] Error receiving message: ", result.reason);
            set_state(RunnerState::StreamError);
            break;
    }
    summary_.end_state = state();
    summary_.end_reason = result.reason;
    log_debug("[", endpoint_.name, "] Read loop ended: ", to_string(result.end));

    log_info("[", endpoint_.name, "] Stream closed. Total transactions: ", summary_.transactions,
             ", Account updates: ", summary_.account_updates);

    if (local_) {
        summary_.local_dual = summarize_dual_stream(local_->snapshot(), true);
        std::ostringstream os;
        print_dual_stream_report(os, *summary_.local_dual, "DUAL STREAM STATISTICS FOR " + endpoint_.name);
        log_info(os.str());
    }

    set_state(RunnerState::Terminated);
    return summary_;
}

void EndpointRunner::on_frame(const std::string& raw) {
    if (stop_requested_) return;

    updates_.clear();
    if (!protocol_->parse(raw, updates_)) {
        ++summary_.decode_failures;
        log_debug("[", endpoint_.name, "] Failed to decode message (", raw.size(), " bytes); dropped");
        return;
    }

    for (const auto& up : updates_) {
        switch (up.kind) {
            case UpdateKind::Ping: {
                ++summary_.pings;
                const std::string reply = protocol_->ping_reply();
                if (!reply.empty()) {
                    connector_->send(reply);
                    log_debug("[", endpoint_.name, "] Replied to ping");
                }
                break;
            }
            case UpdateKind::Transaction:
                on_transaction(up);
                break;
            case UpdateKind::Account:
                if (local_) on_account(up);
                break;
            case UpdateKind::Error:
                throw StreamError("provider error: " + up.detail);
            case UpdateKind::Other:
                log_debug("[", endpoint_.name, "] Received other update type: ", up.detail);
                break;
        }
        if (stop_requested_) break;
    }
}

void EndpointRunner::on_transaction(const StreamUpdate& up) {
    if (up.signature.empty()) return;
    const auto& keys = up.account_keys;
    if (std::find(keys.begin(), keys.end(), ctx_.config.account) == keys.end()) return;

    const double ts = now_seconds();
    log_->write_entry(ts, tx_label_, up.signature);

    if (local_) {
        const auto u = local_->record(StreamSlot::Transaction, up.signature, ts);
        if (ctx_.dual_tracker.merge(StreamSlot::Transaction, endpoint_.name, up.signature, ts))
            log_debug("[", endpoint_.name, "] Earliest ", to_string(StreamSlot::Transaction),
                      " sighting of ", short_id(up.signature));
        if (u.became_complete) report_lead_lag(*u.record);
    }

    const auto res = ctx_.comparator.add(endpoint_.name, Observation{up.signature, ts, ctx_.start_time});
    ++summary_.transactions;
    log_info("[", std::fixed, std::setprecision(3), ts, "] [", endpoint_.name, "] Slot: ", up.slot,
             " Signature: ", up.signature);

    if (res.new_race && res.valid_count == ctx_.config.transactions) {
        on_target_reached(res.valid_count);
    }
}

void EndpointRunner::on_account(const StreamUpdate& up) {
    if (!up.account.empty() && up.account != ctx_.config.account) return;
    ++summary_.account_updates;

    if (up.signature.empty()) {
        log_debug("[", endpoint_.name, "] Account update without transaction signature at slot ", up.slot);
        return;
    }

    const double ts = now_seconds();
    log_->write_entry(ts, acct_label_, up.signature);

    const auto u = local_->record(StreamSlot::Account, up.signature, ts);
    if (ctx_.dual_tracker.merge(StreamSlot::Account, endpoint_.name, up.signature, ts))
        log_debug("[", endpoint_.name, "] Earliest ", to_string(StreamSlot::Account),
                  " sighting of ", short_id(up.signature));

    if (summary_.account_updates <= kLoggedAccountUpdates) {
        log_info("[", endpoint_.name, "] Account update #", summary_.account_updates,
                 " for ", short_id(up.account.empty() ? ctx_.config.account : up.account),
                 " with sig ", short_id(up.signature), " at ", std::fixed, std::setprecision(3), ts);
    }
    if (u.became_complete) report_lead_lag(*u.record);
}

void EndpointRunner::report_lead_lag(const DualStreamRecord& rec) {
    const double diff = rec.delta_ms();
    if (diff == 0.0) {
        log_info("[", endpoint_.name, "] Dual stream match for ", short_id(rec.signature),
                 ": TX and ACCT arrived together");
        return;
    }
    log_info("[", endpoint_.name, "] Dual stream match for ", short_id(rec.signature), ": TX was ",
             std::fixed, std::setprecision(3), std::fabs(diff), "ms ",
             diff > 0 ? "later" : "earlier", " than ACCT");
}

void EndpointRunner::on_target_reached(std::size_t valid_count) {
    stop_requested_ = true;
    summary_.triggered_shutdown = true;
    log_info("Endpoint ", endpoint_.name, " shutting down after ", summary_.transactions,
             " transactions seen and ", valid_count, " by all workers");
    ctx_.shutdown.trigger();
    connector_->close();
}
