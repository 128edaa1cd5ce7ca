#pragma once
#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "dual_stream.hpp"
#include "race_types.hpp"

// Average / median / extremes of a set of millisecond deltas.
struct DeltaSummary {
    std::size_t count{0};
    double avg_ms{0};
    double median_ms{0};
    double min_ms{0};
    double max_ms{0};
};

// nullopt for an empty input.
std::optional<DeltaSummary> summarize_deltas(std::vector<double> deltas_ms);

struct EndpointWins {
    std::string endpoint;
    std::size_t wins{0};
    double pct{0}; // of all tracked signatures
};

// Cross-channel timing for dual-stream endpoints (account write vs transaction).
struct DualStreamReport {
    std::size_t total_signatures{0};
    std::vector<EndpointWins> account_first;     // ranked, most wins first
    std::vector<EndpointWins> transaction_first; // ranked, most wins first

    std::size_t both_received{0};
    std::size_t account_faster{0};
    std::size_t transaction_faster{0}; // includes ties
    double account_faster_pct{0};
    double transaction_faster_pct{0};
    std::optional<DeltaSummary> delta; // transaction - account, ms
    bool absolute_deltas{false};       // delta built from |transaction - account|

    bool has_data() const noexcept { return total_signatures > 0; }
};

// The per-endpoint view reports absolute deltas; the global one keeps the sign.
DualStreamReport summarize_dual_stream(const std::vector<DualStreamRecord>& records,
                                       bool absolute_deltas = false);

struct EndpointRaceStats {
    std::string endpoint;
    std::size_t seen{0};  // races this endpoint reported at all
    std::size_t wins{0};  // races this endpoint reported first
    double win_pct{0};    // of all races
    std::optional<DeltaSummary> lag; // ms behind the winner, races it lost
};

struct RaceReport {
    std::size_t races{0};
    double elapsed_s{0}; // run epoch -> last new race
    std::vector<EndpointRaceStats> endpoints; // ranked, most wins first

    bool has_data() const noexcept { return races > 0; }
};

RaceReport summarize_races(const std::vector<RaceRecord>& records);

void print_race_report(std::ostream& os, const RaceReport& r);
void print_dual_stream_report(std::ostream& os, const DualStreamReport& r, const std::string& title);
