// File: src/core/types.hpp
#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace itemrec {

// EntityID: Identifier for users, items and orders
// Wraps the warehouse's 64-bit integer keys so they order and hash uniformly
class EntityID {
public:
    using ValueType = int64_t;

    EntityID() : value_(0) {}
    explicit EntityID(ValueType value) : value_(value) {}

    ValueType value() const { return value_; }

    // Comparison operators
    bool operator==(const EntityID& other) const { return value_ == other.value_; }
    bool operator!=(const EntityID& other) const { return value_ != other.value_; }
    bool operator<(const EntityID& other) const { return value_ < other.value_; }
    bool operator>(const EntityID& other) const { return value_ > other.value_; }
    bool operator<=(const EntityID& other) const { return value_ <= other.value_; }
    bool operator>=(const EntityID& other) const { return value_ >= other.value_; }

    std::string ToString() const;

    // Parse decimal representation, throws std::invalid_argument on garbage
    static EntityID Parse(const std::string& text);

    // Hash support for std::unordered_map
    struct Hash {
        size_t operator()(const EntityID& id) const {
            return std::hash<ValueType>()(id.value_);
        }
    };

private:
    ValueType value_;
};

using UserID = EntityID;
using ItemID = EntityID;
using OrderID = EntityID;

// ModelType: Which relatedness engine produced a recommendation
enum class ModelType : uint8_t {
    PAIRWISE = 1,   // Item-item similarity over the interaction matrix
    ITEMSET = 2,    // Frequent itemsets mined from transactions
};

const char* ToString(ModelType type);

ModelType ParseModelType(const std::string& str);

// SimilarityKind: Closed set of supported item-item metrics
enum class SimilarityKind : uint8_t {
    COSINE = 0,
    JACCARD = 1,
};

const char* ToString(SimilarityKind kind);

// Parse metric name (case-insensitive)
// @throws UnsupportedSimilarityMetric for anything outside {cosine, jaccard}
SimilarityKind ParseSimilarityKind(const std::string& str);

// InteractionEvent: One raw row from the event source
// Fields are optional so partially-null rows can be represented and discarded
struct InteractionEvent {
    std::optional<UserID> user_id;
    std::optional<ItemID> item_id;
    std::optional<OrderID> order_id;

    static InteractionEvent UserItem(UserID user, ItemID item) {
        return InteractionEvent{user, item, std::nullopt};
    }

    static InteractionEvent OrderItem(OrderID order, ItemID item) {
        return InteractionEvent{std::nullopt, item, order};
    }
};

// Recommendation: One recommended item for one source entity
// source_entity_id is a user (pairwise) or an item (itemset)
struct Recommendation {
    EntityID source_entity_id;
    ItemID recommended_item_id;
    std::optional<double> score;
    std::optional<int> rank;
    ModelType model_type{ModelType::PAIRWISE};

    bool operator==(const Recommendation& other) const {
        return source_entity_id == other.source_entity_id &&
               recommended_item_id == other.recommended_item_id &&
               score == other.score &&
               rank == other.rank &&
               model_type == other.model_type;
    }
};

} // namespace itemrec

// Hash specialization for std::unordered_map
namespace std {
    template<>
    struct hash<itemrec::EntityID> {
        size_t operator()(const itemrec::EntityID& id) const {
            return itemrec::EntityID::Hash()(id);
        }
    };
}
