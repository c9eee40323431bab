// File: examples/pairwise_example.cpp
//
// Collaborative item-to-item recommendation example.
// Demonstrates:
// - Building an InteractionMatrix from user events
// - Pruning sparse rows with SparsityReducer
// - Computing cosine and Jaccard similarity between items
// - Generating per-user recommendations with failure isolation

#include "data/interaction_matrix.hpp"
#include "pruning/sparsity_reducer.hpp"
#include "ranking/pairwise_recommender.hpp"
#include "similarity/similarity_matrix.hpp"
#include "similarity/similarity_metric.hpp"
#include <iomanip>
#include <iostream>
#include <vector>

using namespace itemrec;

/// One interaction of a user with an item
InteractionEvent View(int64_t user, int64_t item) {
    InteractionEvent event;
    event.user_id = UserID(user);
    event.item_id = ItemID(item);
    return event;
}

void PrintSimilarities(const SimilarityMatrix& similarity, const std::vector<ItemID>& items) {
    std::cout << std::fixed << std::setprecision(5);
    for (size_t i = 0; i < items.size(); ++i) {
        for (size_t j = i + 1; j < items.size(); ++j) {
            std::cout << "  sim(" << items[i].ToString() << ", " << items[j].ToString()
                      << ") = " << *similarity.Score(items[i], items[j]) << "\n";
        }
    }
}

int main() {
    std::cout << "=== Pairwise Recommendation Example ===\n\n";

    // Step 1: Build the interaction matrix
    std::cout << "Step 1: Building interaction matrix...\n";

    std::vector<InteractionEvent> events = {
        View(10, 101), View(10, 101), View(30, 101),
        View(10, 102), View(20, 102), View(20, 102), View(20, 102),
        View(20, 103), View(30, 103), View(30, 103),
    };

    InteractionMatrix matrix = InteractionMatrix::FromEvents(events);
    std::cout << "  " << matrix.ItemCount() << " items x " << matrix.UserCount()
              << " users from " << events.size() << " events\n\n";

    // Step 2: Reduce sparsity (item pruning off for this tiny matrix)
    std::cout << "Step 2: Reducing sparsity...\n";

    SparsityReducer::Config reducer_config;
    reducer_config.prune_items = false;
    SparsityReducer reducer(reducer_config);

    auto reduced = reducer.Reduce(matrix);
    std::cout << "  Dropped " << reduced.dropped_items.size() << " items and "
              << reduced.dropped_users.size() << " users\n";
    std::cout << "  Missing cells after fill: " << reduced.matrix.MissingCount() << "\n\n";

    // Step 3: Compare metrics
    std::cout << "Step 3: Computing item similarity...\n";

    CosineSimilarity cosine;
    JaccardSimilarity jaccard;
    SimilarityMatrix cosine_matrix = SimilarityMatrix::Compute(reduced.matrix, cosine);
    SimilarityMatrix jaccard_matrix = SimilarityMatrix::Compute(reduced.matrix, jaccard);

    std::cout << " Cosine:\n";
    PrintSimilarities(cosine_matrix, reduced.matrix.Items());
    std::cout << " Jaccard:\n";
    PrintSimilarities(jaccard_matrix, reduced.matrix.Items());
    std::cout << "\n";

    // Step 4: Recommend
    std::cout << "Step 4: Generating recommendations...\n";

    PairwiseRecommender::Config rec_config;
    rec_config.top_n_recommendations = 6;
    PairwiseRecommender recommender(rec_config);

    RecommendationBatch batch = recommender.RecommendAll(reduced.matrix, cosine_matrix);
    for (const auto& rec : batch.recommendations) {
        std::cout << "  User " << rec.source_entity_id.ToString()
                  << " -> item " << rec.recommended_item_id.ToString()
                  << " (score " << *rec.score << ")\n";
    }
    std::cout << "  " << batch.SucceededCount() << " of " << batch.entities_processed
              << " users served\n";

    for (const auto& failure : batch.failures) {
        std::cout << "  Failed " << failure.entity_id.ToString() << ": "
                  << failure.reason << "\n";
    }

    std::cout << "\n=== Example Complete ===\n";
    return 0;
}
