// File: tests/ranking/itemset_recommender_test.cpp
#include "ranking/itemset_recommender.hpp"
#include "core/errors.hpp"
#include <gtest/gtest.h>
#include <vector>

namespace itemrec {
namespace {

// ============================================================================
// Helper Functions
// ============================================================================

const ItemID kA(1);
const ItemID kB(2);
const ItemID kC(3);
const ItemID kD(4);
const ItemID kE(5);

FrequentItemset Itemset(std::vector<ItemID> items, double support) {
    FrequentItemset itemset;
    itemset.items = std::move(items);
    itemset.support = support;
    return itemset;
}

// Itemsets of length > 2 mined from [{A,B,C},{A,B},{A,B,C,D},{B,C}]
std::vector<FrequentItemset> WorkedExampleItemsets() {
    return {
        Itemset({kA, kB, kC}, 0.5),
        Itemset({kA, kB, kD}, 0.25),
        Itemset({kA, kC, kD}, 0.25),
        Itemset({kB, kC, kD}, 0.25),
        Itemset({kA, kB, kC, kD}, 0.25),
    };
}

std::vector<ItemID> RecommendedItems(const std::vector<Recommendation>& recs) {
    std::vector<ItemID> items;
    for (const auto& rec : recs) {
        items.push_back(rec.recommended_item_id);
    }
    return items;
}

// ============================================================================
// Ranking Tests
// ============================================================================

ItemsetRecommender TopOne() {
    ItemsetRecommender::Config config;
    config.top_itemsets_per_candidate = 1;
    return ItemsetRecommender(config);
}

const ItemID kF(6);

TEST(ItemsetRecommenderTest, HigherSupportRanksFirst) {
    std::vector<FrequentItemset> itemsets = {
        Itemset({kA, kC, kD, kE}, 0.25),
        Itemset({kA, kB}, 0.5),
    };

    auto recs = TopOne().RecommendForItem(itemsets, kA);

    EXPECT_EQ((std::vector<ItemID>{kB}), RecommendedItems(recs));
}

TEST(ItemsetRecommenderTest, LongerItemsetWinsSupportTie) {
    std::vector<FrequentItemset> itemsets = {
        Itemset({kA, kB, kC}, 0.25),
        Itemset({kA, kD, kE, kF}, 0.25),
    };

    auto recs = TopOne().RecommendForItem(itemsets, kA);

    EXPECT_EQ((std::vector<ItemID>{kD, kE, kF}), RecommendedItems(recs));
}

TEST(ItemsetRecommenderTest, SmallerMembersWinFullTie) {
    std::vector<FrequentItemset> itemsets = {
        Itemset({kA, kC, kD}, 0.25),
        Itemset({kA, kB, kE}, 0.25),
    };

    auto recs = TopOne().RecommendForItem(itemsets, kA);

    EXPECT_EQ((std::vector<ItemID>{kB, kE}), RecommendedItems(recs));
}

TEST(ItemsetRecommenderTest, RecommendAllUsesSameRanking) {
    std::vector<FrequentItemset> itemsets = {
        Itemset({kA, kB, kC}, 0.25),
        Itemset({kA, kD, kE, kF}, 0.25),
    };

    auto batch = TopOne().RecommendAll(itemsets);

    std::vector<ItemID> for_a;
    for (const auto& rec : batch.recommendations) {
        if (rec.source_entity_id == kA) {
            for_a.push_back(rec.recommended_item_id);
        }
    }
    EXPECT_EQ((std::vector<ItemID>{kD, kE, kF}), for_a);
}

// ============================================================================
// Generation Tests
// ============================================================================

TEST(ItemsetRecommenderTest, CandidateExcludedFromItsRecommendations) {
    ItemsetRecommender recommender;

    auto recs = recommender.RecommendForItem(WorkedExampleItemsets(), kA);

    EXPECT_EQ((std::vector<ItemID>{kB, kC, kD}), RecommendedItems(recs));
    for (const auto& rec : recs) {
        EXPECT_EQ(kA, rec.source_entity_id);
        EXPECT_NE(kA, rec.recommended_item_id);
        EXPECT_FALSE(rec.score.has_value());
        EXPECT_EQ(ModelType::ITEMSET, rec.model_type);
    }
}

TEST(ItemsetRecommenderTest, UnionLimitedToTopItemsets) {
    ItemsetRecommender::Config config;
    config.top_itemsets_per_candidate = 1;
    ItemsetRecommender recommender(config);
    std::vector<FrequentItemset> itemsets = {
        Itemset({kA, kB, kC}, 0.5),
        Itemset({kA, kD, kE}, 0.25),
    };

    auto recs = recommender.RecommendForItem(itemsets, kA);

    EXPECT_EQ((std::vector<ItemID>{kB, kC}), RecommendedItems(recs));
}

TEST(ItemsetRecommenderTest, MissingCandidateFails) {
    ItemsetRecommender recommender;

    EXPECT_THROW(recommender.RecommendForItem(WorkedExampleItemsets(), kE),
                 RecommendationGenerationFailure);
}

TEST(ItemsetRecommenderTest, RecommendAllCoversEveryCandidate) {
    ItemsetRecommender recommender;

    auto batch = recommender.RecommendAll(WorkedExampleItemsets());

    EXPECT_EQ(4u, batch.entities_processed);
    EXPECT_FALSE(batch.HasFailures());
    // Every candidate here reaches the other three items
    EXPECT_EQ(12u, batch.recommendations.size());

    // Grouped by candidate ascending, then recommended item ascending
    EXPECT_EQ(kA, batch.recommendations.front().source_entity_id);
    EXPECT_EQ(kD, batch.recommendations.back().source_entity_id);
    for (const auto& rec : batch.recommendations) {
        EXPECT_NE(rec.source_entity_id, rec.recommended_item_id);
    }
}

TEST(ItemsetRecommenderTest, RecommendAllMatchesPerItemResults) {
    ItemsetRecommender recommender;
    auto itemsets = WorkedExampleItemsets();

    auto batch = recommender.RecommendAll(itemsets);

    std::vector<Recommendation> expected;
    for (const auto& candidate : {kA, kB, kC, kD}) {
        auto recs = recommender.RecommendForItem(itemsets, candidate);
        expected.insert(expected.end(), recs.begin(), recs.end());
    }
    EXPECT_EQ(expected, batch.recommendations);
}

TEST(ItemsetRecommenderTest, EmptyItemsetsYieldEmptyBatch) {
    ItemsetRecommender recommender;

    auto batch = recommender.RecommendAll({});

    EXPECT_EQ(0u, batch.entities_processed);
    EXPECT_TRUE(batch.recommendations.empty());
}

TEST(ItemsetRecommenderTest, RejectsZeroTopItemsets) {
    ItemsetRecommender::Config config;
    config.top_itemsets_per_candidate = 0;

    EXPECT_THROW(ItemsetRecommender{config}, std::invalid_argument);
}

} // namespace
} // namespace itemrec
