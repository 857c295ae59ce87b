#ifndef SUPPORT_COUNTER_H
#define SUPPORT_COUNTER_H

#include <vector>
#include <string>
#include "types.h"

class TransactionStore;

// Number of transactions containing every item of itemset.
// The empty itemset is contained in every transaction. An item without
// postings (including ids the index never saw) forces the result to 0.
Support support(const Itemset& itemset, const InvertedIndex& index);

// Same, addressed by label. Labels that never occur give 0.
Support support_of(const TransactionStore& store, const std::vector<std::string>& labels);

#endif // SUPPORT_COUNTER_H
