// File: src/ranking/pairwise_recommender.cpp
#include "ranking/pairwise_recommender.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <map>
#include <stdexcept>

namespace itemrec {

// ============================================================================
// Construction
// ============================================================================

PairwiseRecommender::PairwiseRecommender()
    : PairwiseRecommender(Config())
{
}

PairwiseRecommender::PairwiseRecommender(const Config& config)
    : config_(config)
{
    if (config_.top_n_recommendations == 0) {
        throw std::invalid_argument("top_n_recommendations must be > 0");
    }
    if (config_.score_precision < 0 || config_.score_precision > 12) {
        throw std::invalid_argument("score_precision must be in [0,12]");
    }
}

// ============================================================================
// Per-user Generation
// ============================================================================

std::vector<std::pair<ItemID, InteractionMatrix::CountType>> PairwiseRecommender::SelectSeeds(
        const InteractionMatrix& matrix,
        UserID user) const {
    auto col = matrix.UserIndex(user);
    if (!col) {
        throw RecommendationGenerationFailure("user " + user.ToString() +
                                              " is not in the interaction matrix");
    }

    std::vector<std::pair<ItemID, InteractionMatrix::CountType>> seeds;
    for (size_t row = 0; row < matrix.ItemCount(); ++row) {
        const auto& cell = matrix.At(row, *col);
        if (cell && *cell != 0) {
            seeds.emplace_back(matrix.Items()[row], *cell);
        }
    }

    std::sort(seeds.begin(), seeds.end(),
        [](const auto& a, const auto& b) {
            if (a.second != b.second) {
                return a.second > b.second;
            }
            return a.first < b.first;
        });

    if (seeds.size() > config_.top_n_recommendations) {
        seeds.resize(config_.top_n_recommendations);
    }

    return seeds;
}

std::vector<Recommendation> PairwiseRecommender::RecommendForUser(
        const InteractionMatrix& matrix,
        const SimilarityMatrix& similarity,
        UserID user) const {
    auto seeds = SelectSeeds(matrix, user);

    // Keyed by recommended item, last write wins: a later (weaker) seed
    // reaching the same item replaces the earlier score
    std::map<ItemID, double> scores;

    for (const auto& [seed, count] : seeds) {
        if (!similarity.HasItem(seed)) {
            throw RecommendationGenerationFailure("no similarity row for item " +
                                                  seed.ToString());
        }
        auto neighbor = similarity.MostSimilar(seed);
        if (!neighbor) {
            throw RecommendationGenerationFailure("item " + seed.ToString() +
                                                  " has no other item to compare with");
        }
        scores.insert_or_assign(neighbor->item, RoundScore(neighbor->score));
    }

    std::vector<Recommendation> recommendations;
    recommendations.reserve(scores.size());
    for (const auto& [item, score] : scores) {
        Recommendation rec;
        rec.source_entity_id = user;
        rec.recommended_item_id = item;
        rec.score = score;
        rec.model_type = ModelType::PAIRWISE;
        recommendations.push_back(rec);
    }

    return recommendations;
}

RecommendationBatch PairwiseRecommender::RecommendAll(
        const InteractionMatrix& matrix,
        const SimilarityMatrix& similarity) const {
    RecommendationBatch batch;

    for (const auto& user : matrix.Users()) {
        ++batch.entities_processed;
        try {
            auto recommendations = RecommendForUser(matrix, similarity, user);
            batch.recommendations.insert(batch.recommendations.end(),
                                         recommendations.begin(),
                                         recommendations.end());
        } catch (const RecommendationGenerationFailure& e) {
            LogDebug("User " + user.ToString() + " failed: " + e.what());
            batch.failures.push_back(EntityFailure{user, e.what()});
        }
    }

    LogDebug("Generated " + std::to_string(batch.recommendations.size()) +
             " recommendations for " + std::to_string(batch.SucceededCount()) + " users (" +
             std::to_string(batch.failures.size()) + " failed)");
    return batch;
}

double PairwiseRecommender::RoundScore(double score) const {
    const double scale = std::pow(10.0, config_.score_precision);
    return std::round(score * scale) / scale;
}

void PairwiseRecommender::LogDebug(const std::string& message) const {
    if (config_.debug_logging) {
        std::cout << "[PairwiseRecommender] " << message << std::endl;
    }
}

} // namespace itemrec
