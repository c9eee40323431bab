// File: src/association/transaction_encoder.cpp
#include "association/transaction_encoder.hpp"
#include <algorithm>
#include <stdexcept>

namespace itemrec {

// ============================================================================
// PresenceTable
// ============================================================================

PresenceTable::PresenceTable(std::vector<ItemID> columns, std::vector<std::vector<bool>> rows)
    : columns_(std::move(columns)),
      rows_(std::move(rows))
{
    for (const auto& row : rows_) {
        if (row.size() != columns_.size()) {
            throw std::invalid_argument("PresenceTable row width does not match column count");
        }
    }
}

std::vector<size_t> PresenceTable::PresentColumns(size_t row) const {
    std::vector<size_t> present;
    const auto& flags = rows_[row];
    for (size_t col = 0; col < flags.size(); ++col) {
        if (flags[col]) {
            present.push_back(col);
        }
    }
    return present;
}

// ============================================================================
// TransactionEncoder
// ============================================================================

TransactionEncoder& TransactionEncoder::Fit(const TransactionList& transactions) {
    columns_ = transactions.DistinctItems();
    return *this;
}

PresenceTable TransactionEncoder::Transform(const TransactionList& transactions) const {
    std::vector<std::vector<bool>> rows;
    rows.reserve(transactions.Size());

    for (const auto& transaction : transactions) {
        std::vector<bool> row(columns_.size(), false);
        for (const auto& item : transaction.items) {
            auto it = std::lower_bound(columns_.begin(), columns_.end(), item);
            if (it != columns_.end() && *it == item) {
                row[static_cast<size_t>(it - columns_.begin())] = true;
            }
        }
        rows.push_back(std::move(row));
    }

    return PresenceTable(columns_, std::move(rows));
}

PresenceTable TransactionEncoder::FitTransform(const TransactionList& transactions) {
    return Fit(transactions).Transform(transactions);
}

} // namespace itemrec
