// File: src/pruning/sparsity_reducer.hpp
#pragma once

#include "core/types.hpp"
#include "data/interaction_matrix.hpp"
#include "data/transaction_list.hpp"
#include <string>
#include <vector>

namespace itemrec {

/// SparsityReducer: Remove low-signal rows before relatedness is computed
///
/// Collaborative path:
/// - Drops item rows with few weak cells (present cells valued <= weak_cell_value)
/// - Drops user columns left without any interaction
/// - Fills the remaining absent cells with 0
///
/// Association path:
/// - Drops transactions with fewer raw item events than min_basket_size
///
/// The item rule is applied literally: an item is dropped when it has at
/// most max_weak_cells_for_drop weak cells, which also removes items whose
/// interactions are mostly strong.
class SparsityReducer {
public:
    /// Configuration for pruning thresholds
    struct Config {
        Config() = default;

        /// Cells at or below this count are weak signal
        InteractionMatrix::CountType weak_cell_value{1};

        /// Items with at most this many weak cells are dropped
        size_t max_weak_cells_for_drop{2};

        /// Disable to keep every item row (users and fill still apply)
        bool prune_items{true};

        /// Orders with fewer raw item events are dropped
        size_t min_basket_size{4};

        bool debug_logging{false};
    };

    /// Result of reducing an interaction matrix
    struct MatrixResult {
        InteractionMatrix matrix;
        std::vector<ItemID> dropped_items;
        std::vector<UserID> dropped_users;
    };

    /// Result of reducing a transaction list
    struct TransactionResult {
        TransactionList transactions;
        std::vector<OrderID> dropped_orders;
    };

    // ========================================================================
    // Construction
    // ========================================================================

    SparsityReducer() = default;

    /// @throws std::invalid_argument if config is invalid
    explicit SparsityReducer(const Config& config);

    // ========================================================================
    // Reduction
    // ========================================================================

    /// Prune items, then users, then fill absent cells with zero
    /// @throws AllItemsPrunedError if every item row is dropped
    MatrixResult Reduce(const InteractionMatrix& matrix) const;

    /// Drop short baskets
    /// @throws EmptyInteractionData if every transaction is dropped
    TransactionResult Reduce(const TransactionList& transactions) const;

    // ========================================================================
    // Selection Rules
    // ========================================================================

    /// Items the literal weak-cell rule selects for removal (ascending)
    std::vector<ItemID> SelectSparseItems(const InteractionMatrix& matrix) const;

    /// Users with no present cell among the matrix's items (ascending)
    std::vector<UserID> SelectInactiveUsers(const InteractionMatrix& matrix) const;

    const Config& GetConfig() const { return config_; }

private:
    Config config_;

    void ValidateConfig() const;

    void LogDebug(const std::string& message) const;
};

} // namespace itemrec
