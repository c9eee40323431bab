// File: examples/basket_example.cpp
//
// Frequently-bought-together example using the itemset model.
// Demonstrates:
// - Grouping order events into transactions
// - Dropping short baskets
// - Mining frequent itemsets with FP-growth
// - Turning itemsets into per-item recommendations
// - Assembling output records as CSV

#include "association/frequent_itemset_model.hpp"
#include "data/transaction_list.hpp"
#include "output/output_assembler.hpp"
#include "pruning/sparsity_reducer.hpp"
#include "ranking/itemset_recommender.hpp"
#include <iostream>
#include <vector>

using namespace itemrec;

/// Every item of one order as events
void AddOrder(std::vector<InteractionEvent>& events, int64_t order,
              const std::vector<int64_t>& items) {
    for (int64_t item : items) {
        InteractionEvent event;
        event.order_id = OrderID(order);
        event.item_id = ItemID(item);
        events.push_back(event);
    }
}

int main() {
    std::cout << "=== Basket Recommendation Example ===\n\n";

    // Step 1: Group orders
    std::cout << "Step 1: Grouping order events...\n";

    std::vector<InteractionEvent> events;
    AddOrder(events, 1001, {1, 2, 3});
    AddOrder(events, 1002, {1, 2});
    AddOrder(events, 1003, {1, 2, 3, 4});
    AddOrder(events, 1004, {2, 3});
    AddOrder(events, 1005, {7});

    TransactionList transactions = TransactionList::FromEvents(events);
    std::cout << "  " << transactions.Size() << " orders over "
              << transactions.DistinctItems().size() << " items\n\n";

    // Step 2: Drop single-item baskets
    std::cout << "Step 2: Dropping short baskets...\n";

    SparsityReducer::Config reducer_config;
    reducer_config.min_basket_size = 2;
    SparsityReducer reducer(reducer_config);

    auto reduced = reducer.Reduce(transactions);
    std::cout << "  Kept " << reduced.transactions.Size() << ", dropped "
              << reduced.dropped_orders.size() << "\n\n";

    // Step 3: Mine itemsets
    std::cout << "Step 3: Mining frequent itemsets...\n";

    FrequentItemsetModel::Config model_config;
    model_config.min_support = 0.25;
    FrequentItemsetModel model(model_config);

    auto fitted = model.Fit(reduced.transactions);
    std::cout << "  Mined " << fitted.mined_count << ", kept "
              << fitted.itemsets.size() << " with more than "
              << model_config.min_itemset_length_filter << " items\n";
    for (const auto& itemset : fitted.itemsets) {
        std::cout << "  {";
        for (size_t i = 0; i < itemset.items.size(); ++i) {
            std::cout << (i > 0 ? ", " : "") << itemset.items[i].ToString();
        }
        std::cout << "} support " << itemset.support << "\n";
    }
    std::cout << "\n";

    // Step 4: Recommend and assemble
    std::cout << "Step 4: Generating recommendations...\n";

    ItemsetRecommender recommender;
    RecommendationBatch batch = recommender.RecommendAll(fitted.itemsets);

    OutputAssembler assembler;
    auto records = assembler.Assemble(batch.recommendations,
                                      OutputAssembler::CurrentTimestamp());
    assembler.WriteCsv(std::cout, records);

    std::cout << "\n=== Example Complete ===\n";
    return 0;
}
