// File: src/data/interaction_matrix.cpp
#include "data/interaction_matrix.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cstddef>
#include <map>
#include <set>
#include <stdexcept>

namespace itemrec {

namespace {

template <typename T>
bool IsStrictlyAscending(const std::vector<T>& values) {
    return std::adjacent_find(values.begin(), values.end(),
        [](const T& a, const T& b) { return !(a < b); }) == values.end();
}

template <typename T>
std::optional<size_t> BinaryIndex(const std::vector<T>& sorted, const T& value) {
    auto it = std::lower_bound(sorted.begin(), sorted.end(), value);
    if (it == sorted.end() || *it != value) {
        return std::nullopt;
    }
    return static_cast<size_t>(it - sorted.begin());
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

InteractionMatrix::InteractionMatrix(std::vector<ItemID> items,
                                     std::vector<UserID> users,
                                     std::vector<Cell> cells)
    : items_(std::move(items)),
      users_(std::move(users)),
      cells_(std::move(cells))
{
    if (!IsStrictlyAscending(items_)) {
        throw std::invalid_argument("InteractionMatrix items must be unique and ascending");
    }
    if (!IsStrictlyAscending(users_)) {
        throw std::invalid_argument("InteractionMatrix users must be unique and ascending");
    }
    if (cells_.size() != items_.size() * users_.size()) {
        throw std::invalid_argument("InteractionMatrix cell count does not match shape");
    }
}

InteractionMatrix InteractionMatrix::FromEvents(const std::vector<InteractionEvent>& events) {
    // (item, user) -> count; std::map keeps both axes sorted
    std::map<std::pair<ItemID, UserID>, CountType> counts;
    std::set<UserID> user_set;

    for (const auto& event : events) {
        if (!event.user_id || !event.item_id) {
            continue;
        }
        counts[{*event.item_id, *event.user_id}]++;
        user_set.insert(*event.user_id);
    }

    if (counts.empty()) {
        throw EmptyInteractionData("no (user_id, item_id) events to build a matrix from");
    }

    std::vector<ItemID> items;
    for (const auto& [key, count] : counts) {
        if (items.empty() || items.back() != key.first) {
            items.push_back(key.first);
        }
    }
    std::vector<UserID> users(user_set.begin(), user_set.end());

    std::vector<Cell> cells(items.size() * users.size());
    size_t row = 0;
    for (const auto& [key, count] : counts) {
        while (items[row] != key.first) {
            ++row;
        }
        size_t col = *BinaryIndex(users, key.second);
        cells[row * users.size() + col] = count;
    }

    return InteractionMatrix(std::move(items), std::move(users), std::move(cells));
}

// ============================================================================
// Axes and Cells
// ============================================================================

std::optional<size_t> InteractionMatrix::UserIndex(UserID user) const {
    return BinaryIndex(users_, user);
}

std::vector<double> InteractionMatrix::RowVector(size_t row) const {
    std::vector<double> values(users_.size(), 0.0);
    for (size_t col = 0; col < users_.size(); ++col) {
        const Cell& cell = At(row, col);
        if (cell) {
            values[col] = static_cast<double>(*cell);
        }
    }
    return values;
}

size_t InteractionMatrix::MissingCount() const {
    return static_cast<size_t>(std::count_if(cells_.begin(), cells_.end(),
        [](const Cell& cell) { return !cell.has_value(); }));
}

// ============================================================================
// Transformations
// ============================================================================

InteractionMatrix InteractionMatrix::WithoutItems(const std::vector<ItemID>& drop) const {
    std::set<ItemID> dropped(drop.begin(), drop.end());

    std::vector<ItemID> items;
    std::vector<Cell> cells;
    cells.reserve(cells_.size());

    for (size_t row = 0; row < items_.size(); ++row) {
        if (dropped.count(items_[row]) > 0) {
            continue;
        }
        items.push_back(items_[row]);
        auto begin = cells_.begin() + static_cast<std::ptrdiff_t>(row * users_.size());
        cells.insert(cells.end(), begin, begin + static_cast<std::ptrdiff_t>(users_.size()));
    }

    return InteractionMatrix(std::move(items), users_, std::move(cells));
}

InteractionMatrix InteractionMatrix::WithoutUsers(const std::vector<UserID>& drop) const {
    std::set<UserID> dropped(drop.begin(), drop.end());

    std::vector<size_t> kept_cols;
    std::vector<UserID> users;
    for (size_t col = 0; col < users_.size(); ++col) {
        if (dropped.count(users_[col]) == 0) {
            kept_cols.push_back(col);
            users.push_back(users_[col]);
        }
    }

    std::vector<Cell> cells;
    cells.reserve(items_.size() * users.size());
    for (size_t row = 0; row < items_.size(); ++row) {
        for (size_t col : kept_cols) {
            cells.push_back(At(row, col));
        }
    }

    return InteractionMatrix(items_, std::move(users), std::move(cells));
}

InteractionMatrix InteractionMatrix::FillMissing(CountType value) const {
    std::vector<Cell> cells(cells_);
    for (auto& cell : cells) {
        if (!cell) {
            cell = value;
        }
    }
    return InteractionMatrix(items_, users_, std::move(cells));
}

} // namespace itemrec
