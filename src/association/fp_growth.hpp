// File: src/association/fp_growth.hpp
#pragma once

#include "core/types.hpp"
#include "association/transaction_encoder.hpp"
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

namespace itemrec {

/// FrequentItemset: Items that appear together in enough transactions
struct FrequentItemset {
    /// Member items, ascending
    std::vector<ItemID> items;

    /// Fraction of transactions containing every member, in (0, 1]
    double support{0.0};

    size_t Length() const { return items.size(); }

    bool operator==(const FrequentItemset& other) const {
        return items == other.items && support == other.support;
    }
};

/// FPGrowthMiner: Frequent itemset mining over a PresenceTable
///
/// Builds a frequent-pattern tree (prefix tree of transactions with items in
/// descending frequency order, plus a header table linking every node of
/// each item) and grows itemsets recursively from conditional pattern bases.
/// Every transaction is scanned twice: once to count items, once to insert.
///
/// Determinism: header tables order items by count descending, then column
/// ascending, and the final result is sorted by (length, items).
class FPGrowthMiner {
public:
    struct Config {
        Config() = default;
        /// Minimum fraction of transactions an itemset must appear in
        double min_support{0.0001};
        /// Largest itemset to enumerate
        size_t max_itemset_length{10};
    };

    FPGrowthMiner();

    /// @throws std::invalid_argument if config is invalid
    explicit FPGrowthMiner(const Config& config);

    /// Mine every itemset meeting the support and length bounds
    /// @return Itemsets ordered by length ascending, then items ascending
    std::vector<FrequentItemset> Mine(const PresenceTable& table) const;

    /// Smallest transaction count that satisfies min_support (at least 1)
    static uint64_t MinimumCount(double min_support, size_t transaction_count);

    const Config& GetConfig() const { return config_; }

private:
    struct Node {
        size_t column;
        uint64_t count;
        Node* parent;
        std::vector<std::unique_ptr<Node>> children;

        Node(size_t col, uint64_t cnt, Node* par) : column(col), count(cnt), parent(par) {}

        Node* FindChild(size_t col) const;
    };

    struct HeaderEntry {
        size_t column;
        uint64_t count;
        std::vector<Node*> node_links;
    };

    struct Tree {
        std::unique_ptr<Node> root;
        std::vector<HeaderEntry> header;  // count descending, column ascending

        bool IsEmpty() const { return header.empty(); }
    };

    /// (path of columns, multiplicity)
    using PatternBase = std::vector<std::pair<std::vector<size_t>, uint64_t>>;

    /// Raw mined pattern: (columns, count)
    using RawPattern = std::pair<std::vector<size_t>, uint64_t>;

    Config config_;

    void ValidateConfig() const;

    static Tree BuildTree(const PatternBase& base, uint64_t min_count);

    void MineTree(const Tree& tree,
                  std::vector<size_t>& prefix,
                  uint64_t min_count,
                  std::vector<RawPattern>& out) const;
};

} // namespace itemrec
