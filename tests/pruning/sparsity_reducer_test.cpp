// File: tests/pruning/sparsity_reducer_test.cpp
#include "pruning/sparsity_reducer.hpp"
#include "core/errors.hpp"
#include <gtest/gtest.h>
#include <vector>

namespace itemrec {
namespace {

// ============================================================================
// Helper Functions
// ============================================================================

using Cell = InteractionMatrix::Cell;

// -1 marks an absent cell
InteractionMatrix MakeMatrix(const std::vector<int64_t>& items,
                             const std::vector<int64_t>& users,
                             const std::vector<std::vector<int>>& rows) {
    std::vector<ItemID> item_ids;
    for (auto id : items) item_ids.emplace_back(id);
    std::vector<UserID> user_ids;
    for (auto id : users) user_ids.emplace_back(id);

    std::vector<Cell> cells;
    for (const auto& row : rows) {
        for (int value : row) {
            cells.push_back(value < 0 ? Cell() : Cell(static_cast<uint32_t>(value)));
        }
    }
    return InteractionMatrix(item_ids, user_ids, cells);
}

// Item 1: three weak cells (kept)
// Item 2: two weak cells (dropped)
// Item 3: only strong cells (dropped by the literal rule)
// Item 4: four weak cells (kept)
// User 5 interacts only with item 2 and goes once item 2 is dropped
InteractionMatrix MixedMatrix() {
    return MakeMatrix({1, 2, 3, 4}, {1, 2, 3, 4, 5}, {
        {1, 1, 1, -1, -1},
        {1, 1, -1, -1, 3},
        {5, 5, 5, 5, -1},
        {1, 1, 1, 1, -1},
    });
}

Transaction MakeTransaction(int64_t order, std::vector<int64_t> items, size_t events) {
    Transaction t;
    t.order_id = OrderID(order);
    for (auto id : items) t.items.emplace_back(id);
    t.event_count = events;
    return t;
}

// ============================================================================
// Matrix Reduction Tests
// ============================================================================

TEST(SparsityReducerTest, SelectsItemsWithFewWeakCells) {
    SparsityReducer reducer;

    auto sparse = reducer.SelectSparseItems(MixedMatrix());

    EXPECT_EQ((std::vector<ItemID>{ItemID(2), ItemID(3)}), sparse);
}

TEST(SparsityReducerTest, ReduceDropsItemsThenUsersThenFills) {
    SparsityReducer reducer;

    auto result = reducer.Reduce(MixedMatrix());

    EXPECT_EQ((std::vector<ItemID>{ItemID(2), ItemID(3)}), result.dropped_items);
    EXPECT_EQ((std::vector<UserID>{UserID(5)}), result.dropped_users);
    EXPECT_EQ((std::vector<ItemID>{ItemID(1), ItemID(4)}), result.matrix.Items());
    EXPECT_EQ(4u, result.matrix.UserCount());
    EXPECT_EQ(0u, result.matrix.MissingCount());
    auto user4 = result.matrix.UserIndex(UserID(4));
    ASSERT_TRUE(user4.has_value());
    EXPECT_EQ(Cell(0u), result.matrix.At(0, *user4));
}

TEST(SparsityReducerTest, ReduceDoesNotModifyInput) {
    SparsityReducer reducer;
    auto matrix = MixedMatrix();
    auto copy = matrix;

    reducer.Reduce(matrix);

    EXPECT_EQ(copy, matrix);
}

TEST(SparsityReducerTest, PruneItemsDisabledKeepsEveryRow) {
    SparsityReducer::Config config;
    config.prune_items = false;
    SparsityReducer reducer(config);

    auto result = reducer.Reduce(MixedMatrix());

    EXPECT_TRUE(result.dropped_items.empty());
    EXPECT_TRUE(result.dropped_users.empty());
    EXPECT_EQ(4u, result.matrix.ItemCount());
    EXPECT_EQ(0u, result.matrix.MissingCount());
}

TEST(SparsityReducerTest, ThrowsWhenEveryItemIsPruned) {
    SparsityReducer reducer;
    auto strong_only = MakeMatrix({1, 2}, {1, 2}, {{4, 4}, {6, -1}});

    EXPECT_THROW(reducer.Reduce(strong_only), AllItemsPrunedError);
}

TEST(SparsityReducerTest, WeakThresholdIsConfigurable) {
    SparsityReducer::Config config;
    config.weak_cell_value = 5;
    SparsityReducer reducer(config);

    // Every present cell is weak now, and each item has at least three
    auto sparse = reducer.SelectSparseItems(MixedMatrix());

    EXPECT_TRUE(sparse.empty());
}

// ============================================================================
// Transaction Reduction Tests
// ============================================================================

TEST(SparsityReducerTest, DropsShortBaskets) {
    SparsityReducer reducer;
    TransactionList list({
        MakeTransaction(1, {1, 2, 3}, 3),
        MakeTransaction(2, {1, 2, 3, 4}, 4),
        MakeTransaction(3, {1, 2}, 5),
    });

    auto result = reducer.Reduce(list);

    EXPECT_EQ((std::vector<OrderID>{OrderID(1)}), result.dropped_orders);
    ASSERT_EQ(2u, result.transactions.Size());
    EXPECT_EQ(OrderID(2), result.transactions[0].order_id);
    // Repeated events still count towards the basket size
    EXPECT_EQ(OrderID(3), result.transactions[1].order_id);
}

TEST(SparsityReducerTest, ThrowsWhenEveryBasketIsShort) {
    SparsityReducer reducer;
    TransactionList list({MakeTransaction(1, {1, 2}, 2)});

    EXPECT_THROW(reducer.Reduce(list), EmptyInteractionData);
}

TEST(SparsityReducerTest, RejectsZeroBasketSize) {
    SparsityReducer::Config config;
    config.min_basket_size = 0;

    EXPECT_THROW(SparsityReducer{config}, std::invalid_argument);
}

} // namespace
} // namespace itemrec
