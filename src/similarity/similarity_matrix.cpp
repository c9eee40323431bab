// File: src/similarity/similarity_matrix.cpp
#include "similarity/similarity_matrix.hpp"
#include <algorithm>

namespace itemrec {

SimilarityMatrix SimilarityMatrix::Compute(const InteractionMatrix& matrix,
                                           const SimilarityMetric& metric) {
    SimilarityMatrix result;
    result.items_ = matrix.Items();
    result.kind_ = metric.GetKind();

    const size_t n = result.items_.size();
    result.scores_.assign(n * n, 0.0);

    std::vector<std::vector<double>> rows;
    rows.reserve(n);
    for (size_t row = 0; row < n; ++row) {
        rows.push_back(matrix.RowVector(row));
    }

    for (size_t i = 0; i < n; ++i) {
        result.scores_[i * n + i] = metric.Compute(rows[i], rows[i]);
        for (size_t j = i + 1; j < n; ++j) {
            double score = metric.Compute(rows[i], rows[j]);
            result.scores_[i * n + j] = score;
            result.scores_[j * n + i] = score;
        }
    }

    return result;
}

std::optional<size_t> SimilarityMatrix::IndexOf(ItemID item) const {
    auto it = std::lower_bound(items_.begin(), items_.end(), item);
    if (it == items_.end() || *it != item) {
        return std::nullopt;
    }
    return static_cast<size_t>(it - items_.begin());
}

std::optional<double> SimilarityMatrix::Score(ItemID a, ItemID b) const {
    if (a == b) {
        return std::nullopt;
    }
    auto row = IndexOf(a);
    auto col = IndexOf(b);
    if (!row || !col) {
        return std::nullopt;
    }
    return At(*row, *col);
}

std::optional<SimilarityMatrix::Neighbor> SimilarityMatrix::MostSimilar(ItemID item) const {
    auto row = IndexOf(item);
    if (!row) {
        return std::nullopt;
    }

    std::optional<Neighbor> best;
    // Items are ascending, so strict > keeps the smallest id on ties
    for (size_t col = 0; col < items_.size(); ++col) {
        if (col == *row) {
            continue;
        }
        double score = At(*row, col);
        if (!best || score > best->score) {
            best = Neighbor{items_[col], score};
        }
    }

    return best;
}

} // namespace itemrec
