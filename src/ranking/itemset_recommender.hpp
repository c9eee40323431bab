// File: src/ranking/itemset_recommender.hpp
#pragma once

#include "association/fp_growth.hpp"
#include "core/types.hpp"
#include "ranking/recommendation_batch.hpp"
#include <map>
#include <string>
#include <vector>

namespace itemrec {

/// ItemsetRecommender: Per-item recommendations from frequent itemsets
///
/// For each candidate item, the itemsets containing it are ranked by support
/// descending, then length descending, then member ids ascending. The members
/// of the top itemsets are unioned and the candidate itself removed.
/// Scores are left unset: no per-pair value survives the union.
class ItemsetRecommender {
public:
    struct Config {
        Config() = default;
        size_t top_itemsets_per_candidate{3};
        bool debug_logging{false};
    };

    ItemsetRecommender();

    /// @throws std::invalid_argument if config is invalid
    explicit ItemsetRecommender(const Config& config);

    /// Recommendations for one candidate, ordered by recommended item id
    /// @throws RecommendationGenerationFailure if no itemset contains it
    std::vector<Recommendation> RecommendForItem(
        const std::vector<FrequentItemset>& itemsets,
        ItemID candidate) const;

    /// Recommendations for every candidate item
    /// Failures are isolated per candidate and reported in the batch
    RecommendationBatch RecommendAll(const std::vector<FrequentItemset>& itemsets) const;

    const Config& GetConfig() const { return config_; }

private:
    Config config_;

    /// Member item -> indices of the itemsets that contain it
    using ItemsetIndex = std::map<ItemID, std::vector<size_t>>;

    static ItemsetIndex BuildIndex(const std::vector<FrequentItemset>& itemsets);

    /// Indices of the itemsets containing the candidate, best first, capped
    /// at top_itemsets_per_candidate
    std::vector<size_t> TopItemsets(const std::vector<FrequentItemset>& itemsets,
                                    std::vector<size_t> containing) const;

    std::vector<Recommendation> RecommendFromIndex(
        const std::vector<FrequentItemset>& itemsets,
        const ItemsetIndex& index,
        ItemID candidate) const;

    void LogDebug(const std::string& message) const;
};

} // namespace itemrec
