// File: src/association/transaction_encoder.hpp
#pragma once

#include "core/types.hpp"
#include "data/transaction_list.hpp"
#include <vector>

namespace itemrec {

/// PresenceTable: One-hot encoding of transactions
///
/// Columns are the distinct items seen across all transactions (ascending);
/// each row marks which columns a transaction contains.
class PresenceTable {
public:
    PresenceTable() = default;
    PresenceTable(std::vector<ItemID> columns, std::vector<std::vector<bool>> rows);

    size_t RowCount() const { return rows_.size(); }
    size_t ColumnCount() const { return columns_.size(); }

    const std::vector<ItemID>& Columns() const { return columns_; }

    /// Column indices present in a row, ascending
    std::vector<size_t> PresentColumns(size_t row) const;

private:
    std::vector<ItemID> columns_;
    std::vector<std::vector<bool>> rows_;
};

/// TransactionEncoder: Converts item-set transactions into a PresenceTable
class TransactionEncoder {
public:
    /// Learn the column set from the transactions
    TransactionEncoder& Fit(const TransactionList& transactions);

    /// Encode transactions against the learned columns
    /// Items not seen during Fit are ignored
    PresenceTable Transform(const TransactionList& transactions) const;

    /// Fit and transform in one step
    PresenceTable FitTransform(const TransactionList& transactions);

    const std::vector<ItemID>& Columns() const { return columns_; }

private:
    std::vector<ItemID> columns_;
};

} // namespace itemrec
