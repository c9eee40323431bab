// File: src/ranking/recommendation_batch.hpp
#pragma once

#include "core/types.hpp"
#include <string>
#include <vector>

namespace itemrec {

/// An entity whose recommendations could not be produced
struct EntityFailure {
    EntityID entity_id;
    std::string reason;
};

/// Outcome of generating recommendations for many entities
///
/// Entities are processed independently; a failure for one is recorded here
/// and does not stop the others.
struct RecommendationBatch {
    std::vector<Recommendation> recommendations;
    std::vector<EntityFailure> failures;

    /// Entities attempted (succeeded + failed)
    size_t entities_processed{0};

    size_t SucceededCount() const { return entities_processed - failures.size(); }
    bool HasFailures() const { return !failures.empty(); }
};

} // namespace itemrec
