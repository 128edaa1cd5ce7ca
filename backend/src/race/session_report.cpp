#include "session_report.hpp"

#include <ostream>
#include <sstream>

#include "util/json_encode.hpp"

void print_session_report(std::ostream& os, const SessionReport& r) {
    print_race_report(os, r.races);
    if (r.dual_stream) {
        print_dual_stream_report(os, r.dual, "GLOBAL CROSS-ENDPOINT STATISTICS");
    }
}

static void encode_delta(std::ostringstream& os, const DeltaSummary& d) {
    os << "{\"count\":" << d.count << ",\"avg_ms\":";
    json_number(os, d.avg_ms);
    os << ",\"median_ms\":";
    json_number(os, d.median_ms);
    os << ",\"min_ms\":";
    json_number(os, d.min_ms);
    os << ",\"max_ms\":";
    json_number(os, d.max_ms);
    os << "}";
}

static void encode_wins(std::ostringstream& os, const EndpointWins& w) {
    os << "{\"endpoint\":";
    json_string(os, w.endpoint);
    os << ",\"wins\":" << w.wins << ",\"pct\":";
    json_number(os, w.pct);
    os << "}";
}

static void encode_endpoint(std::ostringstream& os, const EndpointRaceStats& st) {
    os << "{\"endpoint\":";
    json_string(os, st.endpoint);
    os << ",\"seen\":" << st.seen << ",\"wins\":" << st.wins << ",\"win_pct\":";
    json_number(os, st.win_pct);
    os << ",\"lag\":";
    json_optional(os, st.lag, encode_delta);
    os << "}";
}

std::string session_report_json(const SessionReport& r) {
    std::ostringstream os;
    os << "{\"races\":{\"count\":" << r.races.races << ",\"elapsed_s\":";
    json_number(os, r.races.elapsed_s);
    os << ",\"endpoints\":";
    json_object_array(os, r.races.endpoints, encode_endpoint);
    os << "}";

    if (r.dual_stream) {
        const auto& d = r.dual;
        os << ",\"dual_stream\":{\"total_signatures\":" << d.total_signatures
           << ",\"account_first\":";
        json_object_array(os, d.account_first, encode_wins);
        os << ",\"transaction_first\":";
        json_object_array(os, d.transaction_first, encode_wins);
        os << ",\"both_received\":" << d.both_received
           << ",\"account_faster\":" << d.account_faster
           << ",\"transaction_faster\":" << d.transaction_faster
           << ",\"delta\":";
        json_optional(os, d.delta, encode_delta);
        os << "}";
    }
    os << "}";
    return os.str();
}
