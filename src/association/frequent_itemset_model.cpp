// File: src/association/frequent_itemset_model.cpp
#include "association/frequent_itemset_model.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace itemrec {

namespace {

FPGrowthMiner::Config MinerConfig(const FrequentItemsetModel::Config& config) {
    FPGrowthMiner::Config miner_config;
    miner_config.min_support = config.min_support;
    miner_config.max_itemset_length = config.max_itemset_length;
    return miner_config;
}

} // namespace

FrequentItemsetModel::FrequentItemsetModel()
    : FrequentItemsetModel(Config())
{
}

FrequentItemsetModel::FrequentItemsetModel(const Config& config)
    : config_(config),
      miner_(MinerConfig(config))
{
    if (config_.min_itemset_length_filter >= config_.max_itemset_length) {
        throw std::invalid_argument(
            "min_itemset_length_filter must be < max_itemset_length");
    }
}

FrequentItemsetModel::Result FrequentItemsetModel::Fit(const TransactionList& transactions) const {
    if (transactions.IsEmpty()) {
        throw EmptyInteractionData("no transactions to mine");
    }

    Result result;
    result.transaction_count = transactions.Size();

    TransactionEncoder encoder;
    PresenceTable table = encoder.FitTransform(transactions);
    result.distinct_item_count = table.ColumnCount();
    LogDebug("Encoded " + std::to_string(table.RowCount()) + " transactions over " +
             std::to_string(table.ColumnCount()) + " items");

    std::vector<FrequentItemset> mined = miner_.Mine(table);
    result.mined_count = mined.size();
    LogDebug("Mined " + std::to_string(mined.size()) + " frequent itemsets");

    result.itemsets = FilterByLength(std::move(mined));
    LogDebug("Kept " + std::to_string(result.itemsets.size()) + " itemsets longer than " +
             std::to_string(config_.min_itemset_length_filter));

    if (result.itemsets.empty()) {
        throw InsufficientSupportItemsets(
            "none of " + std::to_string(result.mined_count) +
            " frequent itemsets has more than " +
            std::to_string(config_.min_itemset_length_filter) + " items");
    }

    return result;
}

std::vector<FrequentItemset> FrequentItemsetModel::FilterByLength(
        std::vector<FrequentItemset> itemsets) const {
    const size_t bound = config_.min_itemset_length_filter;
    itemsets.erase(
        std::remove_if(itemsets.begin(), itemsets.end(),
            [bound](const FrequentItemset& itemset) {
                return itemset.Length() <= bound;
            }),
        itemsets.end());
    return itemsets;
}

void FrequentItemsetModel::LogDebug(const std::string& message) const {
    if (config_.debug_logging) {
        std::cout << "[FrequentItemsetModel] " << message << std::endl;
    }
}

} // namespace itemrec
