// File: src/pipeline/recommendation_pipeline.cpp
#include "pipeline/recommendation_pipeline.hpp"
#include "data/interaction_matrix.hpp"
#include "data/transaction_list.hpp"
#include "similarity/similarity_matrix.hpp"
#include <iostream>
#include <stdexcept>

namespace itemrec {

namespace {

/// Metric first so an unknown name surfaces as its own error type
const PipelineConfig& Validated(const PipelineConfig& config) {
    ParseSimilarityKind(config.pairwise.similarity_metric);

    auto errors = config.GetValidationErrors();
    if (!errors.empty()) {
        std::string message = "Invalid pipeline configuration:";
        for (const auto& error : errors) {
            message += " " + error + ";";
        }
        throw std::invalid_argument(message);
    }
    return config;
}

SparsityReducer::Config ReducerConfig(const PipelineConfig& config) {
    SparsityReducer::Config reducer;
    reducer.prune_items = config.pairwise.prune_items;
    reducer.min_basket_size = config.itemset.min_basket_size;
    reducer.debug_logging = config.logging.debug_logging;
    return reducer;
}

PairwiseRecommender::Config PairwiseConfig(const PipelineConfig& config) {
    PairwiseRecommender::Config pairwise;
    pairwise.top_n_recommendations = config.pairwise.top_n_recommendations;
    pairwise.debug_logging = config.logging.debug_logging;
    return pairwise;
}

FrequentItemsetModel::Config ItemsetModelConfig(const PipelineConfig& config) {
    FrequentItemsetModel::Config model;
    model.min_support = config.itemset.min_support;
    model.max_itemset_length = config.itemset.max_itemset_length;
    model.min_itemset_length_filter = config.itemset.min_itemset_length_filter;
    model.debug_logging = config.logging.debug_logging;
    return model;
}

ItemsetRecommender::Config ItemsetRecommenderConfig(const PipelineConfig& config) {
    ItemsetRecommender::Config recommender;
    recommender.top_itemsets_per_candidate = config.itemset.top_itemsets_per_candidate;
    recommender.debug_logging = config.logging.debug_logging;
    return recommender;
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

RecommendationPipeline::RecommendationPipeline(const PipelineConfig& config)
    : config_(Validated(config)),
      metric_(CreateSimilarityMetric(config_.pairwise.similarity_metric)),
      reducer_(ReducerConfig(config_)),
      pairwise_(PairwiseConfig(config_)),
      itemset_model_(ItemsetModelConfig(config_)),
      itemset_recommender_(ItemsetRecommenderConfig(config_))
{
}

// ============================================================================
// Paths
// ============================================================================

PipelineResult RecommendationPipeline::RunPairwise(
        const std::vector<InteractionEvent>& events) const {
    PipelineResult result;
    result.model_type = ModelType::PAIRWISE;
    result.stats.event_count = events.size();

    auto matrix = InteractionMatrix::FromEvents(events);
    LogDebug("Interaction matrix: " + std::to_string(matrix.ItemCount()) + " items x " +
             std::to_string(matrix.UserCount()) + " users");

    auto reduced = reducer_.Reduce(matrix);
    result.stats.item_count = reduced.matrix.ItemCount();
    result.stats.user_count = reduced.matrix.UserCount();
    result.stats.dropped_items = reduced.dropped_items.size();
    result.stats.dropped_users = reduced.dropped_users.size();

    auto similarity = SimilarityMatrix::Compute(reduced.matrix, *metric_);
    LogDebug(std::string("Computed ") + ToString(similarity.GetKind()) +
             " similarity over " + std::to_string(similarity.Size()) + " items");

    result.batch = pairwise_.RecommendAll(reduced.matrix, similarity);
    return result;
}

PipelineResult RecommendationPipeline::RunItemset(
        const std::vector<InteractionEvent>& events) const {
    PipelineResult result;
    result.model_type = ModelType::ITEMSET;
    result.stats.event_count = events.size();

    auto transactions = TransactionList::FromEvents(events);
    LogDebug("Built " + std::to_string(transactions.Size()) + " transactions");

    auto reduced = reducer_.Reduce(transactions);
    result.stats.transaction_count = reduced.transactions.Size();
    result.stats.dropped_orders = reduced.dropped_orders.size();

    auto fitted = itemset_model_.Fit(reduced.transactions);
    result.stats.itemsets_mined = fitted.mined_count;
    result.stats.itemsets_kept = fitted.itemsets.size();

    result.batch = itemset_recommender_.RecommendAll(fitted.itemsets);
    return result;
}

PipelineResult RecommendationPipeline::Run(
        ModelType model,
        const std::vector<InteractionEvent>& events) const {
    switch (model) {
        case ModelType::PAIRWISE: return RunPairwise(events);
        case ModelType::ITEMSET: return RunItemset(events);
    }
    throw std::invalid_argument("Unknown model type");
}

void RecommendationPipeline::LogDebug(const std::string& message) const {
    if (config_.logging.debug_logging) {
        std::cout << "[RecommendationPipeline] " << message << std::endl;
    }
}

} // namespace itemrec
