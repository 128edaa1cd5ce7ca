#include "race/race_stats.hpp"
#include "race/session_report.hpp"

#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

namespace {

DualStreamRecord dual(const std::string& sig,
                      const std::string& acct_ep, double acct_ts,
                      const std::string& tx_ep, double tx_ts) {
    DualStreamRecord r;
    r.signature = sig;
    r.account_endpoint = acct_ep;
    r.account_ts = acct_ts;
    r.transaction_endpoint = tx_ep;
    r.transaction_ts = tx_ts;
    return r;
}

RaceRecord race(const std::string& sig, double start,
                std::vector<std::pair<std::string, double>> arrivals) {
    RaceRecord r;
    r.signature = sig;
    r.start_time = start;
    r.arrivals = std::move(arrivals);
    return r;
}

} // namespace

TEST(DeltaSummaryTest, EmptyInputHasNoSummary) {
    EXPECT_FALSE(summarize_deltas({}).has_value());
}

TEST(DeltaSummaryTest, MedianIsUpperMiddleElement) {
    auto s = summarize_deltas({4.0, 1.0, 3.0, 2.0});
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->count, 4u);
    EXPECT_DOUBLE_EQ(s->avg_ms, 2.5);
    EXPECT_DOUBLE_EQ(s->median_ms, 3.0);
    EXPECT_DOUBLE_EQ(s->min_ms, 1.0);
    EXPECT_DOUBLE_EQ(s->max_ms, 4.0);
}

// Account update at 5.000, transaction at 5.020.
TEST(DualStreamReportTest, AccountFirstByTwentyMilliseconds) {
    auto r = summarize_dual_stream({dual("S1", "A", 5.000, "A", 5.020)});

    EXPECT_TRUE(r.has_data());
    EXPECT_EQ(r.total_signatures, 1u);
    EXPECT_EQ(r.both_received, 1u);
    EXPECT_EQ(r.account_faster, 1u);
    EXPECT_EQ(r.transaction_faster, 0u);
    EXPECT_DOUBLE_EQ(r.account_faster_pct, 100.0);
    ASSERT_TRUE(r.delta.has_value());
    EXPECT_NEAR(r.delta->avg_ms, 20.0, 1e-6);
    EXPECT_NEAR(r.delta->median_ms, 20.0, 1e-6);
}

TEST(DualStreamReportTest, EqualTimestampsCountAsTransactionFaster) {
    auto r = summarize_dual_stream({dual("S1", "A", 7.0, "B", 7.0),
                                    dual("S2", "A", 8.0, "A", 8.5)});
    EXPECT_EQ(r.account_faster, 1u);
    EXPECT_EQ(r.transaction_faster, 1u);
    EXPECT_DOUBLE_EQ(r.account_faster_pct + r.transaction_faster_pct, 100.0);
}

TEST(DualStreamReportTest, AbsoluteDeltasDropTheSign) {
    std::vector<DualStreamRecord> recs;
    recs.push_back(dual("S1", "A", 1.000, "A", 1.010)); // tx 10ms later
    recs.push_back(dual("S2", "A", 2.030, "A", 2.000)); // tx 30ms earlier

    auto signed_r = summarize_dual_stream(recs);
    ASSERT_TRUE(signed_r.delta.has_value());
    EXPECT_NEAR(signed_r.delta->avg_ms, -10.0, 1e-6);
    EXPECT_NEAR(signed_r.delta->min_ms, -30.0, 1e-6);

    auto abs_r = summarize_dual_stream(recs, true);
    ASSERT_TRUE(abs_r.delta.has_value());
    EXPECT_TRUE(abs_r.absolute_deltas);
    EXPECT_NEAR(abs_r.delta->avg_ms, 20.0, 1e-6);
    EXPECT_NEAR(abs_r.delta->min_ms, 10.0, 1e-6);
    EXPECT_NEAR(abs_r.delta->max_ms, 30.0, 1e-6);

    std::ostringstream os;
    print_dual_stream_report(os, abs_r, "LOCAL");
    EXPECT_NE(os.str().find("(absolute)"), std::string::npos);
    EXPECT_EQ(os.str().find("positive = TX later"), std::string::npos);
}

TEST(DualStreamReportTest, RanksFirstSignalWinsPerEndpoint) {
    std::vector<DualStreamRecord> recs;
    recs.push_back(dual("S1", "A", 1.0, "B", 1.1));
    recs.push_back(dual("S2", "A", 2.0, "A", 1.9));
    DualStreamRecord tx_only;
    tx_only.signature = "S3";
    tx_only.transaction_endpoint = "B";
    tx_only.transaction_ts = 3.0;
    recs.push_back(tx_only);

    auto r = summarize_dual_stream(recs);
    EXPECT_EQ(r.total_signatures, 3u);
    EXPECT_EQ(r.both_received, 2u);

    ASSERT_EQ(r.account_first.size(), 1u);
    EXPECT_EQ(r.account_first[0].endpoint, "A");
    EXPECT_EQ(r.account_first[0].wins, 2u);

    ASSERT_EQ(r.transaction_first.size(), 2u);
    EXPECT_EQ(r.transaction_first[0].endpoint, "B");
    EXPECT_EQ(r.transaction_first[0].wins, 2u);
    EXPECT_NEAR(r.transaction_first[0].pct, 200.0 / 3.0, 1e-9);
}

TEST(DualStreamReportTest, NoRecordsPrintsNoData) {
    auto r = summarize_dual_stream({});
    EXPECT_FALSE(r.has_data());
    EXPECT_FALSE(r.delta.has_value());

    std::ostringstream os;
    print_dual_stream_report(os, r, "TITLE");
    EXPECT_NE(os.str().find("no data"), std::string::npos);
}

TEST(RaceReportTest, WinsAndLagBehindWinner) {
    std::vector<RaceRecord> recs;
    recs.push_back(race("S1", 100.0, {{"A", 101.000}, {"B", 101.005}}));
    recs.push_back(race("S2", 100.0, {{"B", 102.000}, {"A", 102.010}}));
    recs.push_back(race("S3", 100.0, {{"A", 103.000}}));

    auto r = summarize_races(recs);
    EXPECT_EQ(r.races, 3u);
    EXPECT_NEAR(r.elapsed_s, 3.0, 1e-9);
    ASSERT_EQ(r.endpoints.size(), 2u);

    const auto& a = r.endpoints[0];
    EXPECT_EQ(a.endpoint, "A");
    EXPECT_EQ(a.wins, 2u);
    EXPECT_EQ(a.seen, 3u);
    ASSERT_TRUE(a.lag.has_value());
    EXPECT_NEAR(a.lag->avg_ms, 10.0, 1e-6);

    const auto& b = r.endpoints[1];
    EXPECT_EQ(b.endpoint, "B");
    EXPECT_EQ(b.wins, 1u);
    EXPECT_EQ(b.seen, 2u);
    EXPECT_NEAR(b.win_pct, 100.0 / 3.0, 1e-9);
    ASSERT_TRUE(b.lag.has_value());
    EXPECT_NEAR(b.lag->max_ms, 5.0, 1e-6);
}

TEST(RaceReportTest, TieGoesToFirstRecordedArrival) {
    auto r = summarize_races({race("S1", 0.0, {{"B", 1.0}, {"A", 1.0}})});
    ASSERT_EQ(r.endpoints.size(), 2u);
    EXPECT_EQ(r.endpoints[0].endpoint, "B");
    EXPECT_EQ(r.endpoints[0].wins, 1u);
}

TEST(RaceReportTest, NoRacesPrintsNoData) {
    auto r = summarize_races({});
    EXPECT_FALSE(r.has_data());
    std::ostringstream os;
    print_race_report(os, r);
    EXPECT_NE(os.str().find("no data"), std::string::npos);
}

TEST(SessionReportTest, JsonCarriesRaceAndDualSections) {
    SessionReport rep;
    rep.races = summarize_races({race("S1", 0.0, {{"A\"x", 1.0}})});
    rep.dual_stream = true;
    rep.dual = summarize_dual_stream({dual("S1", "A", 5.000, "A", 5.020)});

    const std::string json = session_report_json(rep);
    EXPECT_EQ(json.rfind("{\"races\":{\"count\":1", 0), 0u);
    EXPECT_NE(json.find("\"endpoint\":\"A\\\"x\""), std::string::npos);
    EXPECT_NE(json.find("\"lag\":null"), std::string::npos);
    EXPECT_NE(json.find("\"dual_stream\":{\"total_signatures\":1"), std::string::npos);
    EXPECT_NE(json.find("\"account_faster\":1"), std::string::npos);
}

TEST(SessionReportTest, TransactionOnlyRunOmitsDualSection) {
    SessionReport rep;
    const std::string json = session_report_json(rep);
    EXPECT_EQ(json.find("dual_stream"), std::string::npos);

    std::ostringstream os;
    print_session_report(os, rep);
    EXPECT_EQ(os.str().find("GLOBAL CROSS-ENDPOINT"), std::string::npos);
}
