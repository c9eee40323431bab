// File: src/ranking/pairwise_recommender.hpp
#pragma once

#include "core/types.hpp"
#include "data/interaction_matrix.hpp"
#include "ranking/recommendation_batch.hpp"
#include "similarity/similarity_matrix.hpp"
#include <string>
#include <utility>
#include <vector>

namespace itemrec {

/// PairwiseRecommender: Per-user recommendations from item-item similarity
///
/// For each user:
/// 1. Seeds = the user's interacted items by count descending (ties: item id
///    ascending), capped at top_n_recommendations
/// 2. Each seed maps to its most similar other item
/// 3. Results are keyed by recommended item; when two seeds reach the same
///    item the later seed's score overwrites the earlier one
///
/// A user therefore receives at most top_n_recommendations items, fewer when
/// seeds collide on the same neighbor.
class PairwiseRecommender {
public:
    struct Config {
        Config() = default;
        size_t top_n_recommendations{6};
        /// Decimal places kept in emitted scores
        int score_precision{5};
        bool debug_logging{false};
    };

    PairwiseRecommender();

    /// @throws std::invalid_argument if config is invalid
    explicit PairwiseRecommender(const Config& config);

    /// Seed items for a user, strongest first
    /// @throws RecommendationGenerationFailure if the user is unknown
    std::vector<std::pair<ItemID, InteractionMatrix::CountType>> SelectSeeds(
        const InteractionMatrix& matrix,
        UserID user) const;

    /// Recommendations for one user, ordered by recommended item id
    /// @throws RecommendationGenerationFailure if the user is unknown or a
    ///         seed has no similarity row / no peer item
    std::vector<Recommendation> RecommendForUser(
        const InteractionMatrix& matrix,
        const SimilarityMatrix& similarity,
        UserID user) const;

    /// Recommendations for every user of the matrix (ascending user id)
    /// Failures are isolated per user and reported in the batch
    RecommendationBatch RecommendAll(
        const InteractionMatrix& matrix,
        const SimilarityMatrix& similarity) const;

    /// Round half away from zero to the configured precision
    double RoundScore(double score) const;

    const Config& GetConfig() const { return config_; }

private:
    Config config_;

    void LogDebug(const std::string& message) const;
};

} // namespace itemrec
