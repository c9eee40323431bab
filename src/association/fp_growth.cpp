// File: src/association/fp_growth.cpp
#include "association/fp_growth.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <stdexcept>

namespace itemrec {

// ============================================================================
// Construction
// ============================================================================

FPGrowthMiner::FPGrowthMiner()
    : FPGrowthMiner(Config())
{
}

FPGrowthMiner::FPGrowthMiner(const Config& config)
    : config_(config)
{
    ValidateConfig();
}

void FPGrowthMiner::ValidateConfig() const {
    if (!(config_.min_support > 0.0) || config_.min_support > 1.0) {
        throw std::invalid_argument("min_support must be in (0,1]");
    }
    if (config_.max_itemset_length == 0) {
        throw std::invalid_argument("max_itemset_length must be > 0");
    }
}

uint64_t FPGrowthMiner::MinimumCount(double min_support, size_t transaction_count) {
    // Tolerate representation error, e.g. 0.3 * 10 == 3.0000000000000004
    double raw = min_support * static_cast<double>(transaction_count);
    auto count = static_cast<uint64_t>(std::ceil(raw - 1e-9));
    return std::max<uint64_t>(count, 1);
}

// ============================================================================
// Tree Construction
// ============================================================================

FPGrowthMiner::Node* FPGrowthMiner::Node::FindChild(size_t col) const {
    for (const auto& child : children) {
        if (child->column == col) {
            return child.get();
        }
    }
    return nullptr;
}

FPGrowthMiner::Tree FPGrowthMiner::BuildTree(const PatternBase& base, uint64_t min_count) {
    Tree tree;
    tree.root = std::make_unique<Node>(0, 0, nullptr);

    // First scan: item frequencies
    std::map<size_t, uint64_t> item_count;
    for (const auto& [path, count] : base) {
        for (size_t col : path) {
            item_count[col] += count;
        }
    }

    for (const auto& [col, count] : item_count) {
        if (count >= min_count) {
            tree.header.push_back(HeaderEntry{col, count, {}});
        }
    }

    std::sort(tree.header.begin(), tree.header.end(),
        [](const HeaderEntry& a, const HeaderEntry& b) {
            if (a.count != b.count) {
                return a.count > b.count;
            }
            return a.column < b.column;
        });

    std::map<size_t, size_t> rank;
    for (size_t i = 0; i < tree.header.size(); ++i) {
        rank[tree.header[i].column] = i;
    }

    // Second scan: insert frequent items of each path in header order
    for (const auto& [path, count] : base) {
        std::vector<size_t> filtered;
        for (size_t col : path) {
            if (rank.count(col) > 0) {
                filtered.push_back(col);
            }
        }

        std::sort(filtered.begin(), filtered.end(),
            [&rank](size_t a, size_t b) { return rank.at(a) < rank.at(b); });

        Node* current = tree.root.get();
        for (size_t col : filtered) {
            Node* child = current->FindChild(col);
            if (child) {
                child->count += count;
            } else {
                current->children.push_back(std::make_unique<Node>(col, count, current));
                child = current->children.back().get();
                tree.header[rank.at(col)].node_links.push_back(child);
            }
            current = child;
        }
    }

    return tree;
}

// ============================================================================
// Mining
// ============================================================================

void FPGrowthMiner::MineTree(const Tree& tree,
                             std::vector<size_t>& prefix,
                             uint64_t min_count,
                             std::vector<RawPattern>& out) const {
    // Least frequent first, as in the classic formulation
    for (auto it = tree.header.rbegin(); it != tree.header.rend(); ++it) {
        const HeaderEntry& entry = *it;

        prefix.push_back(entry.column);
        out.emplace_back(prefix, entry.count);

        if (prefix.size() < config_.max_itemset_length) {
            PatternBase conditional_base;
            for (const Node* node : entry.node_links) {
                std::vector<size_t> path;
                for (const Node* up = node->parent; up != nullptr && up->parent != nullptr; up = up->parent) {
                    path.push_back(up->column);
                }
                if (!path.empty()) {
                    std::reverse(path.begin(), path.end());
                    conditional_base.emplace_back(std::move(path), node->count);
                }
            }

            if (!conditional_base.empty()) {
                Tree conditional_tree = BuildTree(conditional_base, min_count);
                if (!conditional_tree.IsEmpty()) {
                    MineTree(conditional_tree, prefix, min_count, out);
                }
            }
        }

        prefix.pop_back();
    }
}

std::vector<FrequentItemset> FPGrowthMiner::Mine(const PresenceTable& table) const {
    std::vector<FrequentItemset> itemsets;
    if (table.RowCount() == 0 || table.ColumnCount() == 0) {
        return itemsets;
    }

    const uint64_t min_count = MinimumCount(config_.min_support, table.RowCount());

    PatternBase base;
    base.reserve(table.RowCount());
    for (size_t row = 0; row < table.RowCount(); ++row) {
        auto present = table.PresentColumns(row);
        if (!present.empty()) {
            base.emplace_back(std::move(present), 1);
        }
    }

    Tree tree = BuildTree(base, min_count);
    std::vector<RawPattern> raw;
    std::vector<size_t> prefix;
    MineTree(tree, prefix, min_count, raw);

    const double total = static_cast<double>(table.RowCount());
    itemsets.reserve(raw.size());
    for (auto& [columns, count] : raw) {
        // Columns are ascending by item id, so sorting columns sorts items
        std::sort(columns.begin(), columns.end());
        FrequentItemset itemset;
        itemset.items.reserve(columns.size());
        for (size_t col : columns) {
            itemset.items.push_back(table.Columns()[col]);
        }
        itemset.support = static_cast<double>(count) / total;
        itemsets.push_back(std::move(itemset));
    }

    std::sort(itemsets.begin(), itemsets.end(),
        [](const FrequentItemset& a, const FrequentItemset& b) {
            if (a.Length() != b.Length()) {
                return a.Length() < b.Length();
            }
            return a.items < b.items;
        });

    return itemsets;
}

} // namespace itemrec
