#ifndef TYPES_H
#define TYPES_H

#include <vector>
#include <map>
#include <cstdint>
#include <cstddef>
#include <utility>

using ItemId = uint32_t;
using TransactionId = uint32_t;
using Support = size_t;

// Strictly increasing item ids. Id order is label order.
using Itemset = std::vector<ItemId>;
using Transaction = std::vector<ItemId>;
using PostingList = std::vector<TransactionId>;

using LevelMap = std::map<Itemset, Support>;

// size k -> {itemset -> support}, only non-empty levels present
using FrequentItemsetTable = std::map<size_t, LevelMap>;

struct InvertedIndex {
    std::vector<PostingList> postings;  // indexed by ItemId
    size_t num_transactions = 0;

    const PostingList& postings_for(ItemId item) const {
        static const PostingList empty;
        if (item >= postings.size()) return empty;
        return postings[item];
    }
};

struct VectorHasher {
    size_t operator()(const std::vector<uint32_t>& v) const {
        size_t seed = v.size();
        for (auto x : v) seed ^= x + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        return seed;
    }
};

inline size_t count_itemsets(const FrequentItemsetTable& table) {
    size_t total = 0;
    for (const auto& [k, level] : table) total += level.size();
    return total;
}

// Folds src into dst. Levels and itemsets never overlap between DFS branches.
inline void merge_tables(FrequentItemsetTable& dst, FrequentItemsetTable&& src) {
    for (auto& [k, level] : src) {
        auto& target = dst[k];
        if (target.empty()) {
            target = std::move(level);
        } else {
            target.merge(level);
        }
    }
}

#endif // TYPES_H
