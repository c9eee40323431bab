// File: src/similarity/similarity_matrix.hpp
#pragma once

#include "core/types.hpp"
#include "data/interaction_matrix.hpp"
#include "similarity/similarity_metric.hpp"
#include <optional>
#include <utility>
#include <vector>

namespace itemrec {

/// SimilarityMatrix: Symmetric item x item score table
///
/// Built once from a filled InteractionMatrix. Only the upper triangle is
/// computed; the lower triangle is a mirror, so Score(a, b) and Score(b, a)
/// are bit-identical. The diagonal is never returned by lookups.
class SimilarityMatrix {
public:
    /// A peer item and its score
    struct Neighbor {
        ItemID item;
        double score;
    };

    SimilarityMatrix() = default;

    /// Compute pairwise scores over item row-vectors
    /// @param matrix Interaction matrix (absent cells read as 0)
    /// @param metric Metric applied to each pair of rows
    static SimilarityMatrix Compute(const InteractionMatrix& matrix,
                                    const SimilarityMetric& metric);

    size_t Size() const { return items_.size(); }
    const std::vector<ItemID>& Items() const { return items_; }
    bool HasItem(ItemID item) const { return IndexOf(item).has_value(); }

    /// Score for two distinct known items
    /// @return nullopt for self-pairs or unknown items
    std::optional<double> Score(ItemID a, ItemID b) const;

    /// Highest scoring other item (ties: smallest item id)
    /// @return nullopt if the item is unknown or has no peers
    std::optional<Neighbor> MostSimilar(ItemID item) const;

    SimilarityKind GetKind() const { return kind_; }

private:
    std::vector<ItemID> items_;
    std::vector<double> scores_;  // row-major, items_.size() squared
    SimilarityKind kind_{SimilarityKind::COSINE};

    std::optional<size_t> IndexOf(ItemID item) const;

    double At(size_t row, size_t col) const {
        return scores_[row * items_.size() + col];
    }
};

} // namespace itemrec
