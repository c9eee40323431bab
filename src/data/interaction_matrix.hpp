// File: src/data/interaction_matrix.hpp
#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace itemrec {

/// InteractionMatrix: Dense item x user table of interaction counts
///
/// Rows are items and columns are users, both kept in ascending id order.
/// A cell is either a count or absent (no observed interaction). Absence is
/// distinct from zero until FillMissing() is applied.
///
/// Instances are values: every transformation returns a new matrix and
/// leaves the source untouched.
class InteractionMatrix {
public:
    using CountType = uint32_t;
    using Cell = std::optional<CountType>;

    InteractionMatrix() = default;

    /// Construct from explicit axes and row-major cells
    /// @throws std::invalid_argument if axes are unsorted/duplicated or
    ///         cell count does not match items * users
    InteractionMatrix(std::vector<ItemID> items,
                      std::vector<UserID> users,
                      std::vector<Cell> cells);

    /// Aggregate raw events into counts per (item, user)
    /// Events missing a user or an item are discarded
    /// @throws EmptyInteractionData if no usable event remains
    static InteractionMatrix FromEvents(const std::vector<InteractionEvent>& events);

    // ========================================================================
    // Shape and Axes
    // ========================================================================

    size_t ItemCount() const { return items_.size(); }
    size_t UserCount() const { return users_.size(); }

    const std::vector<ItemID>& Items() const { return items_; }
    const std::vector<UserID>& Users() const { return users_; }

    /// Column index of a user (nullopt if not present)
    std::optional<size_t> UserIndex(UserID user) const;

    // ========================================================================
    // Cell Access
    // ========================================================================

    const Cell& At(size_t row, size_t col) const {
        return cells_[row * users_.size() + col];
    }

    /// Item row as dense values (absent cells read as 0)
    std::vector<double> RowVector(size_t row) const;

    /// Number of absent cells in the whole matrix
    size_t MissingCount() const;

    // ========================================================================
    // Transformations (return new matrices)
    // ========================================================================

    /// Copy without the given item rows
    InteractionMatrix WithoutItems(const std::vector<ItemID>& drop) const;

    /// Copy without the given user columns
    InteractionMatrix WithoutUsers(const std::vector<UserID>& drop) const;

    /// Copy with every absent cell replaced by `value`
    InteractionMatrix FillMissing(CountType value = 0) const;

    bool operator==(const InteractionMatrix& other) const {
        return items_ == other.items_ && users_ == other.users_ && cells_ == other.cells_;
    }

private:
    std::vector<ItemID> items_;
    std::vector<UserID> users_;
    std::vector<Cell> cells_;  // row-major: items_.size() x users_.size()
};

} // namespace itemrec
