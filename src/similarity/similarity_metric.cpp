// File: src/similarity/similarity_metric.cpp
#include "similarity/similarity_metric.hpp"
#include <cmath>
#include <stdexcept>

namespace itemrec {

namespace {

void RequireSameSize(const std::vector<double>& a, const std::vector<double>& b) {
    if (a.size() != b.size()) {
        throw std::invalid_argument("Similarity vectors must have the same dimension (" +
                                    std::to_string(a.size()) + " vs " +
                                    std::to_string(b.size()) + ")");
    }
}

} // namespace

// ============================================================================
// CosineSimilarity
// ============================================================================

double CosineSimilarity::Compute(const std::vector<double>& a,
                                 const std::vector<double>& b) const {
    RequireSameSize(a, b);

    double dot = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;

    for (size_t i = 0; i < a.size(); ++i) {
        dot += a[i] * b[i];
        norm_a += a[i] * a[i];
        norm_b += b[i] * b[i];
    }

    if (norm_a == 0.0 || norm_b == 0.0) {
        return 0.0;
    }

    return dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
}

// ============================================================================
// JaccardSimilarity
// ============================================================================

double JaccardSimilarity::Compute(const std::vector<double>& a,
                                  const std::vector<double>& b) const {
    RequireSameSize(a, b);

    size_t both = 0;
    size_t either = 0;

    for (size_t i = 0; i < a.size(); ++i) {
        bool in_a = a[i] != 0.0;
        bool in_b = b[i] != 0.0;
        if (in_a && in_b) {
            ++both;
        }
        if (in_a || in_b) {
            ++either;
        }
    }

    if (either == 0) {
        return 1.0;
    }

    return static_cast<double>(both) / static_cast<double>(either);
}

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<SimilarityMetric> CreateSimilarityMetric(SimilarityKind kind) {
    switch (kind) {
        case SimilarityKind::COSINE:
            return std::make_unique<CosineSimilarity>();
        case SimilarityKind::JACCARD:
            return std::make_unique<JaccardSimilarity>();
    }
    throw std::invalid_argument("Unknown SimilarityKind");
}

std::unique_ptr<SimilarityMetric> CreateSimilarityMetric(const std::string& name) {
    return CreateSimilarityMetric(ParseSimilarityKind(name));
}

} // namespace itemrec
