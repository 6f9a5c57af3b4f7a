#include <gtest/gtest.h>

#include <algorithm>
#include <set>

#include "menu/ItemTagger.hpp"
#include "reco/CoOccurrence.hpp"

namespace smartcart::test {

class CooccurrenceTest : public ::testing::Test {
protected:
    void SetUp() override {
        orders = {
            {"Wings", "Fries"},
            {"Wings", "Ranch"},
            {"Wings", "Fries", "Ranch"},
        };
        catalog = build_catalog(orders);
        wings = *catalog.find("Wings");
        fries = *catalog.find("Fries");
        ranch = *catalog.find("Ranch");
    }

    std::vector<Order> orders;
    Catalog catalog;
    ItemId wings = 0, fries = 0, ranch = 0;
};

TEST_F(CooccurrenceTest, AffinityIsDirectedConditionalFrequency) {
    CooccurrenceConfig cfg;
    cfg.sample_size = 3;

    AffinityMatrix m = build_affinity_matrix(catalog, orders, cfg);

    EXPECT_DOUBLE_EQ(m.affinity(wings, fries), 2.0 / 3.0);
    EXPECT_DOUBLE_EQ(m.affinity(wings, ranch), 2.0 / 3.0);
    EXPECT_DOUBLE_EQ(m.affinity(fries, wings), 1.0);
    EXPECT_DOUBLE_EQ(m.affinity(fries, ranch), 0.5);
}

TEST_F(CooccurrenceTest, SelfAndUnknownPairsAreZero) {
    AffinityMatrix m = build_affinity_matrix(catalog, orders);

    EXPECT_EQ(m.affinity(wings, wings), 0.0);
    EXPECT_EQ(m.affinity(wings, 99), 0.0);
    EXPECT_EQ(m.affinity(99, wings), 0.0);
    EXPECT_TRUE(m.row(99).empty());
}

TEST_F(CooccurrenceTest, RepeatedMentionsCountOnceAndUnknownNamesAreIgnored) {
    const std::vector<Order> noisy = {{"Wings", "wings", "Fries", "Lobster"}};
    PairCounts counts = count_all_pairs(catalog, noisy, {});

    EXPECT_EQ(counts.totals[wings], 1u);
    EXPECT_EQ(counts.count(wings, fries), 1u);
    EXPECT_EQ(counts.count(fries, wings), 1u);
    EXPECT_EQ(counts.pairs.size(), 1u);
    EXPECT_EQ(counts.orders_counted, 1u);
}

TEST_F(CooccurrenceTest, PairKeyIsUnordered) {
    EXPECT_EQ(make_pair_key(3, 7), make_pair_key(7, 3));
    EXPECT_EQ(pair_first(make_pair_key(7, 3)), 3u);
    EXPECT_EQ(pair_second(make_pair_key(7, 3)), 7u);
}

TEST_F(CooccurrenceTest, NormalizeRejectsPairsWithoutTotals) {
    PairCounts counts(catalog.size());
    counts.pairs[make_pair_key(wings, fries)] = 1;
    EXPECT_THROW(normalize_counts(counts), std::runtime_error);
}

TEST_F(CooccurrenceTest, BuildStatsAreFilled) {
    std::vector<Order> with_empty = orders;
    with_empty.push_back({});

    BuildStats stats;
    build_affinity_matrix(catalog, with_empty, {}, &stats);

    EXPECT_EQ(stats.orders_available, 4u);
    EXPECT_EQ(stats.orders_sampled, 4u);
    EXPECT_EQ(stats.orders_with_items, 3u);
    EXPECT_EQ(stats.distinct_pairs, 3u);
    EXPECT_EQ(stats.shards, 1u);
}

// A larger synthetic history for the sharding and sampling properties.
class CooccurrencePropertyTest : public ::testing::Test {
protected:
    void SetUp() override {
        const std::vector<std::string> names = {
            "Wings", "Boneless", "Fries", "Cajun Fried Corn", "Ranch",
            "Blue Cheese", "Soda", "Sweet Tea", "Brownie", "Veggie Sticks",
        };
        // deterministic mix of 1 to 4 distinct items per order
        for (size_t i = 0; i < 400; ++i) {
            Order o;
            const size_t n = 1 + i % 4;
            for (size_t k = 0; k < n; ++k) o.push_back(names[(i * 7 + k * 3) % names.size()]);
            orders.push_back(o);
        }
        catalog = build_catalog(orders);
    }

    std::vector<Order> orders;
    Catalog catalog;
};

TEST_F(CooccurrencePropertyTest, ShardCountDoesNotChangeCounts) {
    CooccurrenceConfig one;
    one.shards = 1;
    CooccurrenceConfig many;
    many.shards = 4;
    CooccurrenceConfig hw;
    hw.shards = 0;

    PairCounts a = count_all_pairs(catalog, orders, one);
    PairCounts b = count_all_pairs(catalog, orders, many);
    PairCounts c = count_all_pairs(catalog, orders, hw);

    EXPECT_EQ(a.pairs, b.pairs);
    EXPECT_EQ(a.totals, b.totals);
    EXPECT_EQ(a.orders_counted, b.orders_counted);
    EXPECT_EQ(a.pairs, c.pairs);
    EXPECT_EQ(a.totals, c.totals);
}

TEST_F(CooccurrencePropertyTest, MergeEqualsSingleCount) {
    std::vector<size_t> idx(orders.size());
    for (size_t i = 0; i < idx.size(); ++i) idx[i] = i;

    PairCounts whole = count_pairs(catalog, orders, idx, 0, idx.size());
    PairCounts left = count_pairs(catalog, orders, idx, 0, 150);
    PairCounts right = count_pairs(catalog, orders, idx, 150, idx.size());
    left.merge(right);

    EXPECT_EQ(whole.pairs, left.pairs);
    EXPECT_EQ(whole.totals, left.totals);
}

TEST_F(CooccurrencePropertyTest, RebuildIsIdempotent) {
    CooccurrenceConfig cfg;
    cfg.sample_size = 100;
    cfg.seed = 9;

    AffinityMatrix a = build_affinity_matrix(catalog, orders, cfg);
    AffinityMatrix b = build_affinity_matrix(catalog, orders, cfg);

    ASSERT_EQ(a.item_count(), b.item_count());
    ASSERT_EQ(a.entry_count(), b.entry_count());
    for (ItemId i = 0; i < a.item_count(); ++i) {
        const auto& ra = a.row(i);
        const auto& rb = b.row(i);
        ASSERT_EQ(ra.size(), rb.size());
        for (size_t k = 0; k < ra.size(); ++k) {
            EXPECT_EQ(ra[k].target, rb[k].target);
            EXPECT_EQ(ra[k].affinity, rb[k].affinity);
        }
    }
}

TEST_F(CooccurrencePropertyTest, AffinitiesStayInUnitRangeWithoutSelfPairs) {
    AffinityMatrix m = build_affinity_matrix(catalog, orders);

    for (ItemId a = 0; a < m.item_count(); ++a) {
        ItemId prev = 0;
        bool first = true;
        for (const auto& e : m.row(a)) {
            EXPECT_NE(e.target, a);
            EXPECT_GT(e.affinity, 0.0);
            EXPECT_LE(e.affinity, 1.0);
            if (!first) {
                EXPECT_LT(prev, e.target);
            }
            prev = e.target;
            first = false;
        }
    }
}

TEST_F(CooccurrencePropertyTest, PairCountNeverExceedsItemTotal) {
    PairCounts counts = count_all_pairs(catalog, orders, {});

    for (const auto& kv : counts.pairs) {
        const ItemId a = pair_first(kv.first);
        const ItemId b = pair_second(kv.first);
        EXPECT_LE(kv.second, counts.totals[a]);
        EXPECT_LE(kv.second, counts.totals[b]);
    }
}

TEST(SamplingTest, UniformSampleIsSeededSortedAndDistinct) {
    CooccurrenceConfig cfg;
    cfg.sample_size = 10;
    cfg.seed = 7;

    auto a = sample_order_indices(100, cfg);
    auto b = sample_order_indices(100, cfg);

    ASSERT_EQ(a.size(), 10u);
    EXPECT_EQ(a, b);
    EXPECT_TRUE(std::is_sorted(a.begin(), a.end()));
    EXPECT_EQ(std::set<size_t>(a.begin(), a.end()).size(), a.size());
    EXPECT_LT(a.back(), 100u);

    cfg.seed = 8;
    EXPECT_NE(sample_order_indices(100, cfg), a);
}

TEST(SamplingTest, FirstNTakesTheHead) {
    CooccurrenceConfig cfg;
    cfg.sample_size = 3;
    cfg.sampling = SamplingStrategy::FirstN;

    auto idx = sample_order_indices(10, cfg);
    ASSERT_EQ(idx.size(), 3u);
    EXPECT_EQ(idx[0], 0u);
    EXPECT_EQ(idx[2], 2u);
}

TEST(SamplingTest, BoundAtOrAboveSizeTakesEverything) {
    CooccurrenceConfig cfg;
    cfg.sample_size = 50;
    EXPECT_EQ(sample_order_indices(20, cfg).size(), 20u);

    cfg.sample_size = 0;
    EXPECT_EQ(sample_order_indices(20, cfg).size(), 20u);
    EXPECT_TRUE(sample_order_indices(0, cfg).empty());
}

TEST(SamplingTest, StrategyNamesParse) {
    SamplingStrategy s = SamplingStrategy::Uniform;
    EXPECT_TRUE(parse_sampling("FIRST", s));
    EXPECT_EQ(s, SamplingStrategy::FirstN);
    EXPECT_TRUE(parse_sampling("uniform", s));
    EXPECT_EQ(s, SamplingStrategy::Uniform);
    EXPECT_FALSE(parse_sampling("stratified", s));
    EXPECT_STREQ(sampling_str(SamplingStrategy::FirstN), "first");
}

}  // namespace smartcart::test
