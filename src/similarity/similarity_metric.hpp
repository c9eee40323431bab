// File: src/similarity/similarity_metric.hpp
#pragma once

#include "core/types.hpp"
#include <memory>
#include <string>
#include <vector>

namespace itemrec {

/// Abstract base class for item-item similarity metrics
///
/// Compares two item row-vectors (one value per user) and returns a score
/// in [0.0, 1.0] for non-negative inputs:
/// - 0.0 = no shared interaction
/// - 1.0 = identical interaction profile
class SimilarityMetric {
public:
    virtual ~SimilarityMetric() = default;

    /// Compute similarity between two equally sized vectors
    /// @throws std::invalid_argument if sizes differ
    virtual double Compute(const std::vector<double>& a,
                           const std::vector<double>& b) const = 0;

    /// Metric name as accepted in configuration
    virtual std::string GetName() const = 0;

    /// Which closed-set metric this is
    virtual SimilarityKind GetKind() const = 0;
};

/// Cosine similarity: dot(a,b) / (|a| * |b|)
/// Returns 0.0 when either vector has zero norm
class CosineSimilarity : public SimilarityMetric {
public:
    double Compute(const std::vector<double>& a,
                   const std::vector<double>& b) const override;
    std::string GetName() const override { return "cosine"; }
    SimilarityKind GetKind() const override { return SimilarityKind::COSINE; }
};

/// Jaccard similarity over the non-zero pattern of each vector
///
/// Equal to 1 - Jaccard distance: |a AND b| / |a OR b|.
/// Two all-zero vectors are identical and score 1.0.
class JaccardSimilarity : public SimilarityMetric {
public:
    double Compute(const std::vector<double>& a,
                   const std::vector<double>& b) const override;
    std::string GetName() const override { return "jaccard"; }
    SimilarityKind GetKind() const override { return SimilarityKind::JACCARD; }
};

/// Create the metric implementation for a kind
std::unique_ptr<SimilarityMetric> CreateSimilarityMetric(SimilarityKind kind);

/// Create a metric from its configured name
/// @throws UnsupportedSimilarityMetric for names outside {cosine, jaccard}
std::unique_ptr<SimilarityMetric> CreateSimilarityMetric(const std::string& name);

} // namespace itemrec
