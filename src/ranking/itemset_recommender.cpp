// File: src/ranking/itemset_recommender.cpp
#include "ranking/itemset_recommender.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <iostream>
#include <set>
#include <stdexcept>

namespace itemrec {

namespace {

/// Support descending, length descending, members ascending
bool RanksBefore(const FrequentItemset& a, const FrequentItemset& b) {
    if (a.support != b.support) {
        return a.support > b.support;
    }
    if (a.Length() != b.Length()) {
        return a.Length() > b.Length();
    }
    return a.items < b.items;
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

ItemsetRecommender::ItemsetRecommender()
    : ItemsetRecommender(Config())
{
}

ItemsetRecommender::ItemsetRecommender(const Config& config)
    : config_(config)
{
    if (config_.top_itemsets_per_candidate == 0) {
        throw std::invalid_argument("top_itemsets_per_candidate must be > 0");
    }
}

// ============================================================================
// Ranking
// ============================================================================

ItemsetRecommender::ItemsetIndex ItemsetRecommender::BuildIndex(
        const std::vector<FrequentItemset>& itemsets) {
    ItemsetIndex index;
    for (size_t i = 0; i < itemsets.size(); ++i) {
        for (const auto& item : itemsets[i].items) {
            index[item].push_back(i);
        }
    }
    return index;
}

std::vector<size_t> ItemsetRecommender::TopItemsets(
        const std::vector<FrequentItemset>& itemsets,
        std::vector<size_t> containing) const {
    std::sort(containing.begin(), containing.end(),
        [&itemsets](size_t a, size_t b) {
            return RanksBefore(itemsets[a], itemsets[b]);
        });
    if (containing.size() > config_.top_itemsets_per_candidate) {
        containing.resize(config_.top_itemsets_per_candidate);
    }
    return containing;
}

// ============================================================================
// Generation
// ============================================================================

std::vector<Recommendation> ItemsetRecommender::RecommendFromIndex(
        const std::vector<FrequentItemset>& itemsets,
        const ItemsetIndex& index,
        ItemID candidate) const {
    auto it = index.find(candidate);
    if (it == index.end() || it->second.empty()) {
        throw RecommendationGenerationFailure("item " + candidate.ToString() +
                                              " is not in any frequent itemset");
    }

    const std::vector<size_t> ranked = TopItemsets(itemsets, it->second);

    // Sorted union so emission order never depends on itemset order
    std::set<ItemID> members;
    for (size_t i : ranked) {
        members.insert(itemsets[i].items.begin(), itemsets[i].items.end());
    }
    members.erase(candidate);

    std::vector<Recommendation> recommendations;
    recommendations.reserve(members.size());
    for (const auto& member : members) {
        Recommendation rec;
        rec.source_entity_id = candidate;
        rec.recommended_item_id = member;
        rec.model_type = ModelType::ITEMSET;
        recommendations.push_back(rec);
    }

    return recommendations;
}

std::vector<Recommendation> ItemsetRecommender::RecommendForItem(
        const std::vector<FrequentItemset>& itemsets,
        ItemID candidate) const {
    return RecommendFromIndex(itemsets, BuildIndex(itemsets), candidate);
}

RecommendationBatch ItemsetRecommender::RecommendAll(
        const std::vector<FrequentItemset>& itemsets) const {
    RecommendationBatch batch;
    const ItemsetIndex index = BuildIndex(itemsets);

    // Index keys are the candidate set, already ascending
    for (const auto& [candidate, unused] : index) {
        ++batch.entities_processed;
        try {
            auto recommendations = RecommendFromIndex(itemsets, index, candidate);
            batch.recommendations.insert(batch.recommendations.end(),
                                         recommendations.begin(),
                                         recommendations.end());
        } catch (const RecommendationGenerationFailure& e) {
            LogDebug("Item " + candidate.ToString() + " failed: " + e.what());
            batch.failures.push_back(EntityFailure{candidate, e.what()});
        }
    }

    LogDebug("Generated " + std::to_string(batch.recommendations.size()) +
             " recommendations for " + std::to_string(batch.SucceededCount()) + " items");
    return batch;
}

void ItemsetRecommender::LogDebug(const std::string& message) const {
    if (config_.debug_logging) {
        std::cout << "[ItemsetRecommender] " << message << std::endl;
    }
}

} // namespace itemrec
