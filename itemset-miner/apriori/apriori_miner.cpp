#include "apriori_miner.h"
#include "../support_counter.h"
#include "../signal_handler.h"
#include "../errors.h"
#include "../timer.h"
#include <algorithm>
#include <iterator>
#include <iostream>
#include <unordered_set>
#include <omp.h>

bool AprioriMiner::has_infrequent_subset(const Itemset& candidate, const LevelMap& previous) const {
    Itemset subset;
    subset.reserve(candidate.size() - 1);
    for (size_t skip = 0; skip < candidate.size(); ++skip) {
        subset.clear();
        for (size_t j = 0; j < candidate.size(); ++j) {
            if (j != skip) subset.push_back(candidate[j]);
        }
        if (previous.find(subset) == previous.end()) return true;
    }
    return false;
}

std::vector<Itemset> AprioriMiner::generate_candidates(const LevelMap& previous) const {
    std::vector<const Itemset*> frequent;
    frequent.reserve(previous.size());
    for (const auto& entry : previous) frequent.push_back(&entry.first);

    size_t k = frequent.empty() ? 0 : frequent.front()->size();
    std::unordered_set<Itemset, VectorHasher> unique_candidates;
    Itemset joined;

    for (size_t i = 0; i < frequent.size(); ++i) {
        for (size_t j = i + 1; j < frequent.size(); ++j) {
            joined.clear();
            std::set_union(frequent[i]->begin(), frequent[i]->end(),
                           frequent[j]->begin(), frequent[j]->end(),
                           std::back_inserter(joined));
            if (joined.size() != k + 1) continue;
            if (unique_candidates.count(joined)) continue;
            if (has_infrequent_subset(joined, previous)) continue;
            unique_candidates.insert(joined);
        }
    }

    std::vector<Itemset> candidates(unique_candidates.begin(), unique_candidates.end());
    std::sort(candidates.begin(), candidates.end());
    return candidates;
}

FrequentItemsetTable AprioriMiner::mine(const TransactionStore& store, const MiningParams& params) {
    int threads = prepare_mining(params);
    auto mine_start = start_timer();
    Support min_sup = (Support)params.min_support;
    FrequentItemsetTable table;

    LevelMap current = frequent_items(count_items(store, threads), min_sup);
    const InvertedIndex& index = store.get_index();
    size_t k = 1;

    while (!current.empty()) {
        if (g_stop_requested) {
            std::cout << "\n[!] Mining interrupted at level " << k << ". Discarding partial table." << std::endl;
            throw MiningInterruptedError("Apriori mining interrupted at level " + std::to_string(k));
        }

        std::vector<Itemset> candidates = generate_candidates(current);
        table[k] = std::move(current);
        current = LevelMap{};

        std::cout << "[LOG] Level " << (k + 1) << ": counting " << candidates.size() << " candidates..." << std::endl;
        size_t n_candidates = candidates.size();
        std::vector<Support> supports(n_candidates, 0);

        #pragma omp parallel for schedule(dynamic) num_threads(threads)
        for (size_t i = 0; i < n_candidates; ++i) {
            supports[i] = support(candidates[i], index);
        }

        for (size_t i = 0; i < n_candidates; ++i) {
            if (supports[i] >= min_sup) current.emplace(std::move(candidates[i]), supports[i]);
        }
        ++k;
    }

    print_mining_statistics(name(), table);
    stop_timer("Apriori Mining", mine_start);
    return table;
}
