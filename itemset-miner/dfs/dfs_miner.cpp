#include "dfs_miner.h"
#include "../support_counter.h"
#include "../signal_handler.h"
#include "../errors.h"
#include "../timer.h"
#include <iostream>
#include <omp.h>

FrequentItemsetTable DfsMiner::extend(const InvertedIndex& index,
                                      const Itemset& current,
                                      const std::vector<ItemId>& remaining,
                                      size_t level,
                                      Support min_support) const {
    FrequentItemsetTable result;

    for (size_t i = 0; i < remaining.size(); ++i) {
        // remaining only holds items above current.back(), so this stays sorted
        Itemset new_set = current;
        new_set.push_back(remaining[i]);

        Support sup = support(new_set, index);
        if (sup < min_support) continue;  // no superset can be frequent

        result[level].emplace(new_set, sup);

        if (i + 1 < remaining.size()) {
            std::vector<ItemId> new_remaining(remaining.begin() + i + 1, remaining.end());
            merge_tables(result, extend(index, new_set, new_remaining, level + 1, min_support));
        }
    }
    return result;
}

FrequentItemsetTable DfsMiner::mine(const TransactionStore& store, const MiningParams& params) {
    int threads = prepare_mining(params);
    auto mine_start = start_timer();
    Support min_sup = (Support)params.min_support;
    FrequentItemsetTable table;

    std::cout << "[LOG] Phase 1: Counting " << store.num_items() << " items over "
              << store.num_transactions() << " transactions..." << std::endl;
    LevelMap seeds_level = frequent_items(count_items(store, threads), min_sup);

    if (seeds_level.empty()) {
        std::cout << "[LOG] No item reaches min_support=" << min_sup << std::endl;
        print_mining_statistics(name(), table);
        stop_timer("DFS Mining", mine_start);
        return table;
    }

    std::vector<ItemId> seeds;
    seeds.reserve(seeds_level.size());
    for (const auto& entry : seeds_level) seeds.push_back(entry.first.front());
    table[1] = std::move(seeds_level);

    std::cout << "[LOG] Phase 2: Extending " << seeds.size() << " frequent items depth-first..." << std::endl;
    const InvertedIndex& index = store.get_index();
    size_t n_seeds = seeds.size();

    #pragma omp parallel for schedule(dynamic) num_threads(threads)
    for (size_t i = 0; i < n_seeds; ++i) {
        if (g_stop_requested) continue;
        if (i + 1 == n_seeds) continue;

        std::vector<ItemId> remaining(seeds.begin() + i + 1, seeds.end());
        FrequentItemsetTable branch = extend(index, Itemset{seeds[i]}, remaining, 2, min_sup);

        #pragma omp critical
        merge_tables(table, std::move(branch));
    }

    if (g_stop_requested) {
        std::cout << "\n[!] Mining interrupted. Discarding partial table." << std::endl;
        throw MiningInterruptedError("DFS mining interrupted before all branches finished");
    }

    print_mining_statistics(name(), table);
    stop_timer("DFS Mining", mine_start);
    return table;
}
