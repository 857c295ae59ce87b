#pragma once

#include "../mining_algorithm.h"
#include "../transaction_store.h"
#include "../types.h"
#include <vector>

// Level-wise miner: candidates of size k+1 are pairwise unions of frequent
// k-itemsets. Produces the same table as DfsMiner, which makes it a useful
// cross-check.
class AprioriMiner : public IMiningAlgorithm {
public:
    std::string name() const override { return "apriori"; }

    FrequentItemsetTable mine(const TransactionStore& store,
                              const MiningParams& params) override;

private:
    // Unions of two frequent k-itemsets that have exactly k+1 items, deduplicated
    // and sorted, with any candidate holding an infrequent k-subset removed.
    std::vector<Itemset> generate_candidates(const LevelMap& previous) const;

    bool has_infrequent_subset(const Itemset& candidate, const LevelMap& previous) const;
};
