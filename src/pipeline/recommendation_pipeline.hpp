// File: src/pipeline/recommendation_pipeline.hpp
#pragma once

#include "association/frequent_itemset_model.hpp"
#include "cli/pipeline_config.hpp"
#include "core/types.hpp"
#include "pruning/sparsity_reducer.hpp"
#include "ranking/itemset_recommender.hpp"
#include "ranking/pairwise_recommender.hpp"
#include "ranking/recommendation_batch.hpp"
#include "similarity/similarity_metric.hpp"
#include <memory>
#include <string>
#include <vector>

namespace itemrec {

/// Counters collected while a path runs; fields a path does not touch stay 0
struct PipelineStats {
    size_t event_count{0};

    // Collaborative path
    size_t item_count{0};
    size_t user_count{0};
    size_t dropped_items{0};
    size_t dropped_users{0};

    // Association path
    size_t transaction_count{0};
    size_t dropped_orders{0};
    size_t itemsets_mined{0};
    size_t itemsets_kept{0};
};

struct PipelineResult {
    ModelType model_type{ModelType::PAIRWISE};
    RecommendationBatch batch;
    PipelineStats stats;
};

/// RecommendationPipeline: Wires the stages of both recommendation paths
///
/// Pairwise:  events -> InteractionMatrix -> SparsityReducer -> SimilarityMatrix
///            -> PairwiseRecommender
/// Itemset:   events -> TransactionList -> SparsityReducer -> FrequentItemsetModel
///            -> ItemsetRecommender
///
/// Fatal errors from any stage propagate unchanged. Per-entity failures are
/// carried in the result batch.
class RecommendationPipeline {
public:
    /// @throws UnsupportedSimilarityMetric if the metric name is not supported
    /// @throws std::invalid_argument if any other setting is invalid
    explicit RecommendationPipeline(const PipelineConfig& config);

    PipelineResult RunPairwise(const std::vector<InteractionEvent>& events) const;

    PipelineResult RunItemset(const std::vector<InteractionEvent>& events) const;

    /// Dispatch on model type
    PipelineResult Run(ModelType model, const std::vector<InteractionEvent>& events) const;

    const PipelineConfig& GetConfig() const { return config_; }

private:
    PipelineConfig config_;
    std::unique_ptr<SimilarityMetric> metric_;

    SparsityReducer reducer_;
    PairwiseRecommender pairwise_;
    FrequentItemsetModel itemset_model_;
    ItemsetRecommender itemset_recommender_;

    void LogDebug(const std::string& message) const;
};

} // namespace itemrec
