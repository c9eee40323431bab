// File: src/pruning/sparsity_reducer.cpp
#include "pruning/sparsity_reducer.hpp"
#include "core/errors.hpp"
#include <iostream>
#include <stdexcept>

namespace itemrec {

// ============================================================================
// Construction
// ============================================================================

SparsityReducer::SparsityReducer(const Config& config)
    : config_(config)
{
    ValidateConfig();
}

void SparsityReducer::ValidateConfig() const {
    if (config_.min_basket_size == 0) {
        throw std::invalid_argument("min_basket_size must be > 0");
    }
}

// ============================================================================
// Selection Rules
// ============================================================================

std::vector<ItemID> SparsityReducer::SelectSparseItems(const InteractionMatrix& matrix) const {
    std::vector<ItemID> sparse;
    if (!config_.prune_items) {
        return sparse;
    }

    for (size_t row = 0; row < matrix.ItemCount(); ++row) {
        size_t weak_cells = 0;
        for (size_t col = 0; col < matrix.UserCount(); ++col) {
            const auto& cell = matrix.At(row, col);
            // Absent cells never compare as weak
            if (cell && *cell <= config_.weak_cell_value) {
                ++weak_cells;
            }
        }
        if (weak_cells <= config_.max_weak_cells_for_drop) {
            sparse.push_back(matrix.Items()[row]);
        }
    }

    return sparse;
}

std::vector<UserID> SparsityReducer::SelectInactiveUsers(const InteractionMatrix& matrix) const {
    std::vector<UserID> inactive;

    for (size_t col = 0; col < matrix.UserCount(); ++col) {
        size_t missing = 0;
        for (size_t row = 0; row < matrix.ItemCount(); ++row) {
            if (!matrix.At(row, col)) {
                ++missing;
            }
        }
        if (missing == matrix.ItemCount()) {
            inactive.push_back(matrix.Users()[col]);
        }
    }

    return inactive;
}

// ============================================================================
// Reduction
// ============================================================================

SparsityReducer::MatrixResult SparsityReducer::Reduce(const InteractionMatrix& matrix) const {
    MatrixResult result;

    result.dropped_items = SelectSparseItems(matrix);
    LogDebug("Dropping " + std::to_string(result.dropped_items.size()) + " items");

    if (result.dropped_items.size() == matrix.ItemCount()) {
        throw AllItemsPrunedError(std::to_string(matrix.ItemCount()) +
                                  " items had too few weak-signal cells");
    }

    InteractionMatrix without_items = matrix.WithoutItems(result.dropped_items);

    result.dropped_users = SelectInactiveUsers(without_items);
    LogDebug("Dropping " + std::to_string(result.dropped_users.size()) + " users");

    result.matrix = without_items.WithoutUsers(result.dropped_users).FillMissing(0);
    return result;
}

SparsityReducer::TransactionResult SparsityReducer::Reduce(const TransactionList& transactions) const {
    TransactionResult result;
    std::vector<Transaction> kept;
    kept.reserve(transactions.Size());

    for (const auto& transaction : transactions) {
        if (transaction.event_count < config_.min_basket_size) {
            result.dropped_orders.push_back(transaction.order_id);
        } else {
            kept.push_back(transaction);
        }
    }
    LogDebug("Dropping " + std::to_string(result.dropped_orders.size()) +
             " orders with fewer than " + std::to_string(config_.min_basket_size) + " items");

    if (kept.empty()) {
        throw EmptyInteractionData("no order has at least " +
                                   std::to_string(config_.min_basket_size) + " items");
    }

    result.transactions = TransactionList(std::move(kept));
    return result;
}

void SparsityReducer::LogDebug(const std::string& message) const {
    if (config_.debug_logging) {
        std::cout << "[SparsityReducer] " << message << std::endl;
    }
}

} // namespace itemrec
