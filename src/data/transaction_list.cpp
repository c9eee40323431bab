// File: src/data/transaction_list.cpp
#include "data/transaction_list.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <map>
#include <set>
#include <stdexcept>

namespace itemrec {

TransactionList::TransactionList(std::vector<Transaction> transactions)
    : transactions_(std::move(transactions))
{
    for (auto& transaction : transactions_) {
        if (transaction.event_count == 0) {
            transaction.event_count = transaction.items.size();
        }
        std::sort(transaction.items.begin(), transaction.items.end());
        transaction.items.erase(
            std::unique(transaction.items.begin(), transaction.items.end()),
            transaction.items.end());
    }

    std::sort(transactions_.begin(), transactions_.end(),
        [](const Transaction& a, const Transaction& b) {
            return a.order_id < b.order_id;
        });

    auto duplicate = std::adjacent_find(transactions_.begin(), transactions_.end(),
        [](const Transaction& a, const Transaction& b) {
            return a.order_id == b.order_id;
        });
    if (duplicate != transactions_.end()) {
        throw std::invalid_argument("Duplicate order id in TransactionList: " +
                                    duplicate->order_id.ToString());
    }
}

TransactionList TransactionList::FromEvents(const std::vector<InteractionEvent>& events) {
    struct Group {
        std::set<ItemID> items;
        size_t event_count{0};
    };
    std::map<OrderID, Group> groups;

    for (const auto& event : events) {
        if (!event.order_id || !event.item_id) {
            continue;
        }
        Group& group = groups[*event.order_id];
        group.items.insert(*event.item_id);
        group.event_count++;
    }

    if (groups.empty()) {
        throw EmptyInteractionData("no (order_id, item_id) events to group into transactions");
    }

    std::vector<Transaction> transactions;
    transactions.reserve(groups.size());
    for (const auto& [order, group] : groups) {
        Transaction transaction;
        transaction.order_id = order;
        transaction.items.assign(group.items.begin(), group.items.end());
        transaction.event_count = group.event_count;
        transactions.push_back(std::move(transaction));
    }

    return TransactionList(std::move(transactions));
}

std::vector<ItemID> TransactionList::DistinctItems() const {
    std::set<ItemID> items;
    for (const auto& transaction : transactions_) {
        items.insert(transaction.items.begin(), transaction.items.end());
    }
    return std::vector<ItemID>(items.begin(), items.end());
}

} // namespace itemrec
