#include "config/run_config.hpp"
#include "util/race_log.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>

#include "fixtures/frames.hpp"

using namespace fixtures;

namespace {

std::string endpoints_json() {
    return R"([{"name":"A","url":"wss://a.example","x_token":"abc","provider":"yellowstone"},
               {"name":"B","url":"ws://b.example:9000/stream","provider":"shredstream"}])";
}

std::string config_json(const std::string& extra = "") {
    return R"({"account":")" + watched() + R"(","transactions":25,)" + extra +
           R"("endpoints":)" + endpoints_json() + "}";
}

} // namespace

TEST(RunConfigTest, ParsesFullConfig) {
    auto cfg = parse_run_config(config_json(
        R"("commitment":"finalized","log_dir":"out","report_path":"r.json","verbose":true,)"));

    EXPECT_EQ(cfg.account, watched());
    EXPECT_EQ(cfg.transactions, 25u);
    EXPECT_EQ(cfg.commitment, Commitment::Finalized);
    EXPECT_EQ(cfg.log_dir, "out");
    EXPECT_EQ(cfg.report_path, "r.json");
    EXPECT_TRUE(cfg.verbose);
    ASSERT_EQ(cfg.endpoints.size(), 2u);
    EXPECT_EQ(cfg.endpoints[0].x_token, "abc");
    EXPECT_EQ(cfg.endpoints[1].provider, "shredstream");
    EXPECT_TRUE(cfg.endpoints[1].x_token.empty());
}

TEST(RunConfigTest, AppliesDefaults) {
    auto cfg = parse_run_config(config_json());
    EXPECT_EQ(cfg.commitment, Commitment::Confirmed);
    EXPECT_EQ(cfg.log_dir, "logs");
    EXPECT_TRUE(cfg.report_path.empty());
    EXPECT_FALSE(cfg.verbose);
}

TEST(RunConfigTest, ResolvesTokenFromEnvironment) {
    setenv("FEED_RACE_TEST_TOKEN", "secret", 1);
    const std::string json = R"({"account":")" + watched() +
        R"(","transactions":1,"endpoints":[{"name":"A","url":"wss://a","x_token":"$FEED_RACE_TEST_TOKEN","provider":"yellowstone"}]})";
    auto cfg = parse_run_config(json);
    EXPECT_EQ(cfg.endpoints[0].x_token, "secret");

    unsetenv("FEED_RACE_TEST_TOKEN");
    EXPECT_THROW(parse_run_config(json), ConfigError);
}

TEST(RunConfigTest, RejectsInvalidConfigs) {
    EXPECT_THROW(parse_run_config("{"), ConfigError);
    EXPECT_THROW(parse_run_config("[]"), ConfigError);
    EXPECT_THROW(parse_run_config(config_json(R"("commitment":"eventually",)")), ConfigError);

    // not a 32-byte key
    EXPECT_THROW(parse_run_config(R"({"account":"StV1DL6CwTryKyV","transactions":1,"endpoints":)" +
                                  endpoints_json() + "}"),
                 ConfigError);
    EXPECT_THROW(parse_run_config(R"({"account":")" + watched() + R"(","transactions":0,"endpoints":)" +
                                  endpoints_json() + "}"),
                 ConfigError);
    EXPECT_THROW(parse_run_config(R"({"account":")" + watched() + R"(","transactions":1,"endpoints":[]})"),
                 ConfigError);
}

TEST(RunConfigTest, RejectsBadEndpoints) {
    const std::string head = R"({"account":")" + watched() + R"(","transactions":1,"endpoints":)";
    EXPECT_THROW(parse_run_config(head + R"([{"name":"A","url":"wss://a","provider":"grpc"}]})"), ConfigError);
    EXPECT_THROW(parse_run_config(head + R"([{"name":"","url":"wss://a","provider":"yellowstone"}]})"), ConfigError);
    EXPECT_THROW(parse_run_config(head + R"([{"name":"A","url":"wss://a","provider":"yellowstone"},
                                              {"name":"A","url":"wss://b","provider":"yellowstone"}]})"),
                 ConfigError);
}

TEST(RunConfigTest, UnknownProviderErrorListsKnownProviders) {
    const std::string json = R"({"account":")" + watched() +
        R"(","transactions":1,"endpoints":[{"name":"A","url":"wss://a","provider":"grpc"}]})";
    try {
        parse_run_config(json);
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        const std::string msg = e.what();
        EXPECT_NE(msg.find("unknown provider 'grpc'"), std::string::npos);
        EXPECT_NE(msg.find("known: shredstream, yellowstone, yellowstone_accounts"), std::string::npos);
    }
}

TEST(RunConfigTest, CommitmentNames) {
    EXPECT_STREQ(to_string(Commitment::Processed), "processed");
    EXPECT_EQ(parse_commitment("confirmed"), Commitment::Confirmed);
    EXPECT_FALSE(parse_commitment("CONFIRMED").has_value());
}

TEST(RunConfigTest, LoadsFromFile) {
    const auto path = std::filesystem::temp_directory_path() / "feed_race_config_test.json";
    {
        std::ofstream out(path);
        out << config_json();
    }
    auto cfg = load_run_config(path.string());
    EXPECT_EQ(cfg.endpoints.size(), 2u);
    std::filesystem::remove(path);

    EXPECT_THROW(load_run_config(path.string()), ConfigError);
}

TEST(EnvFileTest, SetsOnlyUnsetVariables) {
    const auto path = std::filesystem::temp_directory_path() / "feed_race_test.env";
    {
        std::ofstream out(path);
        out << "# comment\n"
            << "FEED_RACE_ENV_A = \"alpha\"\n"
            << "FEED_RACE_ENV_B=beta\n"
            << "not a pair\n";
    }
    setenv("FEED_RACE_ENV_B", "kept", 1);
    unsetenv("FEED_RACE_ENV_A");

    load_env_file(path.string());
    EXPECT_STREQ(std::getenv("FEED_RACE_ENV_A"), "alpha");
    EXPECT_STREQ(std::getenv("FEED_RACE_ENV_B"), "kept");

    unsetenv("FEED_RACE_ENV_A");
    unsetenv("FEED_RACE_ENV_B");
    std::filesystem::remove(path);
}

TEST(RaceLogTest, AppendsOneLinePerEntry) {
    const auto dir = std::filesystem::temp_directory_path() / "feed_race_race_log_test" / "nested";
    std::filesystem::remove_all(dir.parent_path());
    {
        RaceLog log(dir.string(), "ep");
        log.write_entry(1700000000.25, "ep_TX", "sig1");
        log.write_entry(1700000001.5, "ep_ACCT", "sig2");
        EXPECT_EQ(log.path(), (dir / "ep.log").string());
    }

    std::ifstream in(dir / "ep.log");
    std::string l1, l2;
    std::getline(in, l1);
    std::getline(in, l2);
    EXPECT_EQ(l1, "1700000000.250000 ep_TX sig1");
    EXPECT_EQ(l2, "1700000001.500000 ep_ACCT sig2");
    std::filesystem::remove_all(dir.parent_path());
}
