#include "summary_extractor.h"

namespace {

// Calls fn with every subset of itemset that is one item smaller.
template <typename Fn>
void for_each_immediate_subset(const Itemset& itemset, Fn&& fn) {
    Itemset subset;
    subset.reserve(itemset.size());
    for (size_t skip = 0; skip < itemset.size(); ++skip) {
        subset.clear();
        for (size_t j = 0; j < itemset.size(); ++j) {
            if (j != skip) subset.push_back(itemset[j]);
        }
        fn(subset);
    }
}

}  // namespace

ItemsetSupportMap flatten(const FrequentItemsetTable& table) {
    ItemsetSupportMap all;
    for (const auto& [k, level] : table) {
        all.insert(level.begin(), level.end());
    }
    return all;
}

ItemsetSupportMap maximal_itemsets(const FrequentItemsetTable& table) {
    ItemsetSupportMap result = flatten(table);

    for (const auto& [k, level] : table) {
        if (k < 2) continue;
        for (const auto& entry : level) {
            for_each_immediate_subset(entry.first, [&](const Itemset& subset) {
                result.erase(subset);
            });
        }
    }
    return result;
}

ItemsetSupportMap closed_itemsets(const FrequentItemsetTable& table) {
    ItemsetSupportMap result = flatten(table);

    for (const auto& [k, level] : table) {
        if (k < 2) continue;
        auto below = table.find(k - 1);
        if (below == table.end()) continue;

        for (const auto& [superset, sup] : level) {
            for_each_immediate_subset(superset, [&](const Itemset& subset) {
                auto it = below->second.find(subset);
                if (it != below->second.end() && it->second == sup) result.erase(subset);
            });
        }
    }
    return result;
}
