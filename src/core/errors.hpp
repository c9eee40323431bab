// File: src/core/errors.hpp
#pragma once

#include <stdexcept>
#include <string>

namespace itemrec {

/// Base class for all recommendation pipeline failures
class RecommenderError : public std::runtime_error {
public:
    explicit RecommenderError(const std::string& message)
        : std::runtime_error(message) {}
};

/// No usable rows remain after building or filtering the input
class EmptyInteractionData : public RecommenderError {
public:
    explicit EmptyInteractionData(const std::string& message)
        : RecommenderError("Empty interaction data: " + message) {}
};

/// Sparsity reduction removed every item from the interaction matrix
class AllItemsPrunedError : public RecommenderError {
public:
    explicit AllItemsPrunedError(const std::string& message)
        : RecommenderError("All items pruned: " + message) {}
};

/// Similarity metric name outside the supported set
class UnsupportedSimilarityMetric : public RecommenderError {
public:
    explicit UnsupportedSimilarityMetric(const std::string& metric)
        : RecommenderError("Unsupported similarity metric: '" + metric +
                           "' (expected cosine or jaccard)"),
          metric_(metric) {}

    const std::string& metric() const { return metric_; }

private:
    std::string metric_;
};

/// No mined itemset passes the minimum length filter
class InsufficientSupportItemsets : public RecommenderError {
public:
    explicit InsufficientSupportItemsets(const std::string& message)
        : RecommenderError("Insufficient support itemsets: " + message) {}
};

/// Recommendations for a single entity could not be produced
/// Caught per entity by the recommenders; never aborts a batch
class RecommendationGenerationFailure : public RecommenderError {
public:
    explicit RecommendationGenerationFailure(const std::string& message)
        : RecommenderError(message) {}
};

} // namespace itemrec
