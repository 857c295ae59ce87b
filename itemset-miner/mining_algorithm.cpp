#include "mining_algorithm.h"
#include "transaction_store.h"
#include "errors.h"
#include <iostream>
#include <omp.h>

int prepare_mining(const MiningParams& params) {
    if (params.min_support < 0) {
        throw InvalidThresholdError("min_support must be >= 0, got " + std::to_string(params.min_support));
    }
    return params.max_threads > 0 ? params.max_threads : omp_get_max_threads();
}

std::vector<Support> count_items(const TransactionStore& store, int threads) {
    const auto& transactions = store.get_transactions();
    size_t n = transactions.size();
    std::vector<Support> counts(store.num_items(), 0);

    #pragma omp parallel num_threads(threads)
    {
        std::vector<Support> local(store.num_items(), 0);

        #pragma omp for schedule(static) nowait
        for (size_t i = 0; i < n; ++i) {
            for (ItemId item : transactions[i]) local[item]++;
        }

        #pragma omp critical
        {
            for (size_t item = 0; item < local.size(); ++item) counts[item] += local[item];
        }
    }
    return counts;
}

LevelMap frequent_items(const std::vector<Support>& counts, Support min_support) {
    LevelMap level;
    for (size_t item = 0; item < counts.size(); ++item) {
        if (counts[item] >= min_support) {
            level.emplace(Itemset{(ItemId)item}, counts[item]);
        }
    }
    return level;
}

void print_mining_statistics(const std::string& algorithm, const FrequentItemsetTable& table) {
    std::cout << "\n========== MINING STATISTICS ==========" << std::endl;
    std::cout << "Algorithm:                    " << algorithm << std::endl;
    for (const auto& [k, level] : table) {
        std::string label = "Level " + std::to_string(k) + " itemsets:";
        if (label.size() < 30) label.resize(30, ' ');
        std::cout << label << level.size() << std::endl;
    }
    std::cout << "Total frequent itemsets:      " << count_itemsets(table) << std::endl;
    std::cout << "=======================================\n" << std::endl;
}
