#pragma once

#include "../mining_algorithm.h"
#include "../transaction_store.h"
#include <vector>

// Depth-first frequent itemset search over the inverted index.
// Itemsets only grow by items strictly greater than their last item, so each
// one is generated exactly once; infrequent sets are never extended.
class DfsMiner : public IMiningAlgorithm {
public:
    std::string name() const override { return "dfs"; }

    FrequentItemsetTable mine(const TransactionStore& store,
                              const MiningParams& params) override;

private:
    // Extends current by each candidate in turn and returns every frequent
    // descendant, keyed by size. level is |current| + 1.
    FrequentItemsetTable extend(const InvertedIndex& index,
                                const Itemset& current,
                                const std::vector<ItemId>& remaining,
                                size_t level,
                                Support min_support) const;
};
