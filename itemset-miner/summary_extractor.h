#ifndef SUMMARY_EXTRACTOR_H
#define SUMMARY_EXTRACTOR_H

#include "types.h"

// Flattened itemset -> support view over a finished table.
using ItemsetSupportMap = std::map<Itemset, Support>;

// Frequent itemsets with no frequent proper superset.
// Only level k+1 is consulted for level k: with Apriori closure any larger
// frequent superset implies one of size k+1.
ItemsetSupportMap maximal_itemsets(const FrequentItemsetTable& table);

// Frequent itemsets with no proper superset of equal support.
// Same one-level argument: support cannot rise along a subset chain.
ItemsetSupportMap closed_itemsets(const FrequentItemsetTable& table);

ItemsetSupportMap flatten(const FrequentItemsetTable& table);

#endif // SUMMARY_EXTRACTOR_H
