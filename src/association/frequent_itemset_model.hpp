// File: src/association/frequent_itemset_model.hpp
#pragma once

#include "association/fp_growth.hpp"
#include "association/transaction_encoder.hpp"
#include "data/transaction_list.hpp"
#include <string>
#include <vector>

namespace itemrec {

/// FrequentItemsetModel: Transactions -> co-purchase itemsets
///
/// Encodes transactions into a presence table, mines frequent itemsets with
/// FP-growth and keeps only itemsets longer than min_itemset_length_filter
/// (by default, sets of three or more items).
class FrequentItemsetModel {
public:
    struct Config {
        Config() = default;
        double min_support{0.0001};
        size_t max_itemset_length{10};
        /// Exclusive lower bound on kept itemset length
        size_t min_itemset_length_filter{2};
        bool debug_logging{false};
    };

    struct Result {
        /// Itemsets passing the length filter (length, then items ascending)
        std::vector<FrequentItemset> itemsets;
        size_t transaction_count{0};
        size_t distinct_item_count{0};
        size_t mined_count{0};
    };

    FrequentItemsetModel();

    /// @throws std::invalid_argument if config is invalid
    explicit FrequentItemsetModel(const Config& config);

    /// Mine and filter itemsets
    /// @throws EmptyInteractionData if there are no transactions
    /// @throws InsufficientSupportItemsets if no itemset passes the filter
    Result Fit(const TransactionList& transactions) const;

    /// Keep itemsets longer than the configured bound
    std::vector<FrequentItemset> FilterByLength(std::vector<FrequentItemset> itemsets) const;

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
    FPGrowthMiner miner_;

    void LogDebug(const std::string& message) const;
};

} // namespace itemrec
