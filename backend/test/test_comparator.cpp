#include "race/comparator.hpp"

#include <atomic>
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

class ComparatorTest : public ::testing::Test {
protected:
    Comparator cmp_;
};

TEST_F(ComparatorTest, EmptyOnStart) {
    EXPECT_EQ(cmp_.get_valid_count(), 0u);
    EXPECT_TRUE(cmp_.records().empty());
    EXPECT_FALSE(cmp_.find("S1").has_value());
}

// Target N = 3, one endpoint reports S1, S2, S3.
TEST_F(ComparatorTest, CountsEachNewSignatureOnce) {
    const std::size_t target = 3;
    std::vector<std::size_t> counts;
    std::size_t crossings = 0;

    for (const char* sig : {"S1", "S2", "S3"}) {
        auto res = cmp_.add("A", Observation{sig, 1.0, 0.0});
        EXPECT_TRUE(res.recorded);
        EXPECT_TRUE(res.new_race);
        counts.push_back(cmp_.get_valid_count());
        if (res.new_race && res.valid_count == target) ++crossings;
    }

    EXPECT_EQ(counts, (std::vector<std::size_t>{1, 2, 3}));
    EXPECT_EQ(crossings, 1u);
}

// A and B both report S1; one record holds both arrivals.
TEST_F(ComparatorTest, SecondEndpointJoinsExistingRecord) {
    auto a = cmp_.add("A", Observation{"S1", 10.000, 0.0});
    auto b = cmp_.add("B", Observation{"S1", 10.005, 0.0});

    EXPECT_TRUE(a.new_race);
    EXPECT_TRUE(b.recorded);
    EXPECT_FALSE(b.new_race);
    EXPECT_EQ(b.valid_count, 1u);
    EXPECT_EQ(cmp_.get_valid_count(), 1u);

    auto rec = cmp_.find("S1");
    ASSERT_TRUE(rec.has_value());
    ASSERT_EQ(rec->arrivals.size(), 2u);
    EXPECT_EQ(rec->arrivals[0].first, "A");
    EXPECT_DOUBLE_EQ(rec->arrivals[0].second, 10.000);
    EXPECT_EQ(rec->arrivals[1].first, "B");
    EXPECT_DOUBLE_EQ(rec->arrivals[1].second, 10.005);
}

TEST_F(ComparatorTest, RepeatFromSameEndpointIsDropped) {
    cmp_.add("A", Observation{"S1", 10.0, 0.0});
    auto again = cmp_.add("A", Observation{"S1", 9.0, 0.0});

    EXPECT_FALSE(again.recorded);
    EXPECT_FALSE(again.new_race);
    EXPECT_EQ(cmp_.get_valid_count(), 1u);

    auto rec = cmp_.find("S1");
    ASSERT_TRUE(rec.has_value());
    ASSERT_EQ(rec->arrivals.size(), 1u);
    EXPECT_DOUBLE_EQ(rec->arrivals[0].second, 10.0);
}

TEST_F(ComparatorTest, RecordsKeepFirstSeenOrder) {
    cmp_.add("A", Observation{"S2", 1.0, 0.0});
    cmp_.add("B", Observation{"S1", 2.0, 0.0});
    cmp_.add("A", Observation{"S1", 3.0, 0.0});

    auto recs = cmp_.records();
    ASSERT_EQ(recs.size(), 2u);
    EXPECT_EQ(recs[0].signature, "S2");
    EXPECT_EQ(recs[1].signature, "S1");
    EXPECT_TRUE(recs[1].has_endpoint("A"));
    EXPECT_TRUE(recs[1].has_endpoint("B"));
}

TEST_F(ComparatorTest, ValidCountNeverDecreases) {
    std::size_t last = 0;
    for (int i = 0; i < 50; ++i) {
        const std::string sig = "S" + std::to_string(i % 20);
        auto res = cmp_.add(i % 2 ? "A" : "B", Observation{sig, static_cast<double>(i), 0.0});
        EXPECT_GE(res.valid_count, last);
        last = res.valid_count;
    }
    EXPECT_EQ(cmp_.get_valid_count(), 20u);
}

TEST_F(ComparatorTest, ExactlyOneCrossingUnderConcurrentWriters) {
    const std::size_t target = 500;
    const int writers = 8;
    std::atomic<int> crossings{0};

    std::vector<std::thread> threads;
    for (int w = 0; w < writers; ++w) {
        threads.emplace_back([&, w] {
            const std::string ep = "EP" + std::to_string(w);
            for (std::size_t i = 0; i < 1000; ++i) {
                auto res = cmp_.add(ep, Observation{"S" + std::to_string(i), 1.0, 0.0});
                if (res.new_race && res.valid_count == target) crossings.fetch_add(1);
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(crossings.load(), 1);
    EXPECT_EQ(cmp_.get_valid_count(), 1000u);
    auto rec = cmp_.find("S42");
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->arrivals.size(), static_cast<std::size_t>(writers));
}
