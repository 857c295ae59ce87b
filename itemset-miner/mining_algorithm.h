#pragma once

#include <string>
#include <vector>
#include "types.h"

class TransactionStore;  // forward declaration

struct MiningParams {
    int min_support;      // absolute transaction count, must be >= 0
    int max_threads = 0;  // per-run team size, 0 uses omp_get_max_threads()
};

// Abstract interface for all frequent itemset mining algorithms
class IMiningAlgorithm {
public:
    virtual ~IMiningAlgorithm() = default;

    // Human-readable name (for logs)
    virtual std::string name() const = 0;

    // Returns the complete frequent itemset table for params.min_support.
    // Throws InvalidThresholdError for a negative threshold and
    // MiningInterruptedError if g_stop_requested was raised mid-run.
    virtual FrequentItemsetTable mine(const TransactionStore& store,
                                      const MiningParams& params) = 0;
};

// Shared by the miners: validates the threshold and returns the team size for
// this run. The process-wide OpenMP setting is left untouched.
int prepare_mining(const MiningParams& params);

// Phase 1: one pass over the transactions, one counter per item.
std::vector<Support> count_items(const TransactionStore& store, int threads);

// Items whose count reaches min_support, in item order, as level 1.
LevelMap frequent_items(const std::vector<Support>& counts, Support min_support);

void print_mining_statistics(const std::string& algorithm, const FrequentItemsetTable& table);
