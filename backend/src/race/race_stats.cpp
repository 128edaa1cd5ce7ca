#include "race_stats.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <numeric>
#include <ostream>
#include <unordered_map>

std::optional<DeltaSummary> summarize_deltas(std::vector<double> deltas_ms) {
    if (deltas_ms.empty()) return std::nullopt;
    std::sort(deltas_ms.begin(), deltas_ms.end());

    DeltaSummary s;
    s.count     = deltas_ms.size();
    s.avg_ms    = std::accumulate(deltas_ms.begin(), deltas_ms.end(), 0.0) / static_cast<double>(s.count);
    s.median_ms = deltas_ms[s.count / 2];
    s.min_ms    = deltas_ms.front();
    s.max_ms    = deltas_ms.back();
    return s;
}

static std::vector<EndpointWins> rank_wins(const std::unordered_map<std::string, std::size_t>& wins,
                                           std::size_t total) {
    std::vector<EndpointWins> out;
    out.reserve(wins.size());
    for (const auto& [ep, n] : wins) {
        out.push_back(EndpointWins{ep, n, static_cast<double>(n) / static_cast<double>(total) * 100.0});
    }
    std::sort(out.begin(), out.end(), [](const EndpointWins& a, const EndpointWins& b) {
        if (a.wins != b.wins) return a.wins > b.wins;
        return a.endpoint < b.endpoint;
    });
    return out;
}

DualStreamReport summarize_dual_stream(const std::vector<DualStreamRecord>& records,
                                       bool absolute_deltas) {
    DualStreamReport r;
    r.absolute_deltas = absolute_deltas;
    r.total_signatures = records.size();
    if (records.empty()) return r;

    std::unordered_map<std::string, std::size_t> acct_wins;
    std::unordered_map<std::string, std::size_t> tx_wins;
    std::vector<double> deltas;

    for (const auto& rec : records) {
        if (rec.account_ts && !rec.account_endpoint.empty()) ++acct_wins[rec.account_endpoint];
        if (rec.transaction_ts && !rec.transaction_endpoint.empty()) ++tx_wins[rec.transaction_endpoint];

        if (!rec.complete()) continue;
        ++r.both_received;
        deltas.push_back(absolute_deltas ? std::fabs(rec.delta_ms()) : rec.delta_ms());
        if (*rec.account_ts < *rec.transaction_ts) ++r.account_faster;
        else                                       ++r.transaction_faster;
    }

    r.account_first     = rank_wins(acct_wins, r.total_signatures);
    r.transaction_first = rank_wins(tx_wins, r.total_signatures);

    if (r.both_received > 0) {
        const double both = static_cast<double>(r.both_received);
        r.account_faster_pct     = static_cast<double>(r.account_faster) / both * 100.0;
        r.transaction_faster_pct = static_cast<double>(r.transaction_faster) / both * 100.0;
        r.delta = summarize_deltas(std::move(deltas));
    }
    return r;
}

RaceReport summarize_races(const std::vector<RaceRecord>& records) {
    RaceReport r;
    r.races = records.size();
    if (records.empty()) return r;

    std::unordered_map<std::string, EndpointRaceStats> per_ep;
    std::unordered_map<std::string, std::vector<double>> lags;

    for (const auto& rec : records) {
        if (rec.arrivals.empty()) continue;

        // Fastest arrival; ties go to whoever was recorded first.
        auto best = rec.arrivals.begin();
        for (auto it = rec.arrivals.begin(); it != rec.arrivals.end(); ++it) {
            if (it->second < best->second) best = it;
        }
        r.elapsed_s = std::max(r.elapsed_s, best->second - rec.start_time);

        for (auto it = rec.arrivals.begin(); it != rec.arrivals.end(); ++it) {
            auto& st = per_ep[it->first];
            st.endpoint = it->first;
            ++st.seen;
            if (it == best) ++st.wins;
            else lags[it->first].push_back((it->second - best->second) * 1000.0);
        }
    }

    for (auto& [ep, st] : per_ep) {
        st.win_pct = static_cast<double>(st.wins) / static_cast<double>(r.races) * 100.0;
        auto lit = lags.find(ep);
        if (lit != lags.end()) st.lag = summarize_deltas(std::move(lit->second));
        r.endpoints.push_back(std::move(st));
    }
    std::sort(r.endpoints.begin(), r.endpoints.end(), [](const EndpointRaceStats& a, const EndpointRaceStats& b) {
        if (a.wins != b.wins) return a.wins > b.wins;
        return a.endpoint < b.endpoint;
    });
    return r;
}

static void print_delta(std::ostream& os, const char* label, const DeltaSummary& d) {
    os << "  " << label << " avg=" << d.avg_ms << "ms"
       << " median=" << d.median_ms << "ms"
       << " min=" << d.min_ms << "ms"
       << " max=" << d.max_ms << "ms"
       << " (n=" << d.count << ")\n";
}

void print_race_report(std::ostream& os, const RaceReport& r) {
    os << "=== ENDPOINT RACE RESULTS ===\n";
    if (!r.has_data()) {
        os << "No races recorded; no data.\n";
        return;
    }
    const auto flags = os.flags();
    const auto prec  = os.precision();
    os << std::fixed << std::setprecision(2);

    os << "Races: " << r.races << " in " << r.elapsed_s << "s\n";
    for (const auto& st : r.endpoints) {
        os << st.endpoint << ": " << st.wins << " wins (" << std::setprecision(1) << st.win_pct << "%)"
           << std::setprecision(2) << ", seen " << st.seen << "\n";
        if (st.lag) print_delta(os, "behind winner:", *st.lag);
    }

    os.flags(flags);
    os.precision(prec);
}

void print_dual_stream_report(std::ostream& os, const DualStreamReport& r, const std::string& title) {
    os << "=== " << title << " ===\n";
    if (!r.has_data()) {
        os << "No signatures tracked; no data.\n";
        return;
    }
    const auto flags = os.flags();
    const auto prec  = os.precision();
    os << std::fixed << std::setprecision(1);

    os << "Total unique signatures tracked: " << r.total_signatures << "\n";
    os << "--- Account Stream First by Endpoint ---\n";
    for (const auto& w : r.account_first)
        os << w.endpoint << ": " << w.wins << " wins (" << w.pct << "%)\n";
    os << "--- Transaction Stream First by Endpoint ---\n";
    for (const auto& w : r.transaction_first)
        os << w.endpoint << ": " << w.wins << " wins (" << w.pct << "%)\n";

    os << "--- Account vs Transaction Stream Timing ---\n";
    if (r.both_received == 0) {
        os << "No signature seen on both streams; no data.\n";
    } else {
        os << "Signatures with both streams: " << r.both_received << "\n";
        os << "Account stream faster: " << r.account_faster << " (" << r.account_faster_pct << "%)\n";
        os << "Transaction stream faster: " << r.transaction_faster << " (" << r.transaction_faster_pct << "%)\n";
        if (r.delta) {
            os << std::setprecision(2);
            if (r.absolute_deltas)
                os << "Average timing difference: " << r.delta->avg_ms << "ms (absolute)\n";
            else
                os << "Average timing difference: " << r.delta->avg_ms << "ms (positive = TX later)\n";
            os << "Median timing difference: " << r.delta->median_ms << "ms\n";
            os << "Min difference: " << r.delta->min_ms << "ms\n";
            os << "Max difference: " << r.delta->max_ms << "ms\n";
        }
    }

    os.flags(flags);
    os.precision(prec);
}
