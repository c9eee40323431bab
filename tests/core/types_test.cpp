// File: tests/core/types_test.cpp
#include "core/types.hpp"
#include "core/errors.hpp"
#include <gtest/gtest.h>
#include <unordered_set>
#include <vector>

namespace itemrec {
namespace {

TEST(EntityIDTest, DefaultConstructorIsZero) {
    EntityID id;
    EXPECT_EQ(0, id.value());
}

TEST(EntityIDTest, ComparisonFollowsValue) {
    EntityID a(5);
    EntityID b(7);

    EXPECT_LT(a, b);
    EXPECT_GT(b, a);
    EXPECT_LE(a, EntityID(5));
    EXPECT_GE(b, EntityID(7));
    EXPECT_EQ(a, EntityID(5));
    EXPECT_NE(a, b);
}

TEST(EntityIDTest, ToStringIsDecimal) {
    EXPECT_EQ("42", EntityID(42).ToString());
    EXPECT_EQ("-3", EntityID(-3).ToString());
}

TEST(EntityIDTest, ParseAcceptsIntegers) {
    EXPECT_EQ(EntityID(123), EntityID::Parse("123"));
    EXPECT_EQ(EntityID(-8), EntityID::Parse("-8"));
    EXPECT_EQ(EntityID(9007199254740993LL), EntityID::Parse("9007199254740993"));
}

TEST(EntityIDTest, ParseRejectsGarbage) {
    EXPECT_THROW(EntityID::Parse(""), std::invalid_argument);
    EXPECT_THROW(EntityID::Parse("abc"), std::invalid_argument);
    EXPECT_THROW(EntityID::Parse("12x"), std::invalid_argument);
    EXPECT_THROW(EntityID::Parse("1.5"), std::invalid_argument);
    EXPECT_THROW(EntityID::Parse("99999999999999999999999"), std::invalid_argument);
}

TEST(EntityIDTest, HashableInUnorderedSet) {
    std::unordered_set<EntityID> ids;
    ids.insert(EntityID(1));
    ids.insert(EntityID(2));
    ids.insert(EntityID(1));

    EXPECT_EQ(2u, ids.size());
    EXPECT_EQ(1u, ids.count(EntityID(2)));
}

TEST(ModelTypeTest, ToStringAndParseAgree) {
    EXPECT_STREQ("pairwise", ToString(ModelType::PAIRWISE));
    EXPECT_STREQ("itemset", ToString(ModelType::ITEMSET));

    EXPECT_EQ(ModelType::PAIRWISE, ParseModelType("pairwise"));
    EXPECT_EQ(ModelType::ITEMSET, ParseModelType("itemset"));
    EXPECT_THROW(ParseModelType("hybrid"), std::invalid_argument);
}

TEST(SimilarityKindTest, ParseIsCaseInsensitive) {
    EXPECT_EQ(SimilarityKind::COSINE, ParseSimilarityKind("cosine"));
    EXPECT_EQ(SimilarityKind::COSINE, ParseSimilarityKind("Cosine"));
    EXPECT_EQ(SimilarityKind::JACCARD, ParseSimilarityKind("JACCARD"));
}

TEST(SimilarityKindTest, UnsupportedNameCarriesMetric) {
    try {
        ParseSimilarityKind("pearson");
        FAIL() << "expected UnsupportedSimilarityMetric";
    } catch (const UnsupportedSimilarityMetric& e) {
        EXPECT_EQ("pearson", e.metric());
    }
}

TEST(ErrorsTest, AllDeriveFromRecommenderError) {
    EXPECT_THROW(throw EmptyInteractionData("x"), RecommenderError);
    EXPECT_THROW(throw AllItemsPrunedError("x"), RecommenderError);
    EXPECT_THROW(throw UnsupportedSimilarityMetric("x"), RecommenderError);
    EXPECT_THROW(throw InsufficientSupportItemsets("x"), RecommenderError);
    EXPECT_THROW(throw RecommendationGenerationFailure("x"), RecommenderError);
    EXPECT_THROW(throw RecommenderError("x"), std::runtime_error);
}

TEST(InteractionEventTest, FactoriesLeaveOtherKeyEmpty) {
    auto user_event = InteractionEvent::UserItem(UserID(1), ItemID(2));
    EXPECT_EQ(UserID(1), user_event.user_id);
    EXPECT_EQ(ItemID(2), user_event.item_id);
    EXPECT_FALSE(user_event.order_id.has_value());

    auto order_event = InteractionEvent::OrderItem(OrderID(3), ItemID(4));
    EXPECT_FALSE(order_event.user_id.has_value());
    EXPECT_EQ(OrderID(3), order_event.order_id);
}

} // namespace
} // namespace itemrec
