// File: src/data/transaction_list.hpp
#pragma once

#include "core/types.hpp"
#include <vector>

namespace itemrec {

/// Transaction: The set of items bought together in one order
struct Transaction {
    OrderID order_id;

    /// Distinct items, ascending
    std::vector<ItemID> items;

    /// Raw item events seen for the order (duplicates included)
    /// Zero means "one event per listed item"
    size_t event_count{0};

    bool operator==(const Transaction& other) const {
        return order_id == other.order_id && items == other.items &&
               event_count == other.event_count;
    }
};

/// TransactionList: Orders grouped from raw events, ascending by order id
class TransactionList {
public:
    TransactionList() = default;
    explicit TransactionList(std::vector<Transaction> transactions);

    /// Group events by order, collapsing each order to its item set
    /// Events missing an order or an item are discarded
    /// @throws EmptyInteractionData if no usable event remains
    static TransactionList FromEvents(const std::vector<InteractionEvent>& events);

    size_t Size() const { return transactions_.size(); }
    bool IsEmpty() const { return transactions_.empty(); }

    const std::vector<Transaction>& Transactions() const { return transactions_; }
    const Transaction& operator[](size_t index) const { return transactions_[index]; }

    using const_iterator = std::vector<Transaction>::const_iterator;
    const_iterator begin() const { return transactions_.begin(); }
    const_iterator end() const { return transactions_.end(); }

    /// Distinct items across all transactions, ascending
    std::vector<ItemID> DistinctItems() const;

private:
    std::vector<Transaction> transactions_;
};

} // namespace itemrec
