#include "support_counter.h"
#include "transaction_store.h"
#include <algorithm>
#include <iterator>

Support support(const Itemset& itemset, const InvertedIndex& index) {
    if (itemset.empty()) return index.num_transactions;

    std::vector<const PostingList*> lists;
    lists.reserve(itemset.size());
    for (ItemId item : itemset) {
        const PostingList& list = index.postings_for(item);
        if (list.empty()) return 0;
        lists.push_back(&list);
    }

    // Smallest list first keeps every intermediate result small
    std::sort(lists.begin(), lists.end(),
              [](const PostingList* a, const PostingList* b) { return a->size() < b->size(); });

    if (lists.size() == 1) return lists[0]->size();

    PostingList current = *lists[0];
    PostingList next;
    for (size_t i = 1; i < lists.size() && !current.empty(); ++i) {
        next.clear();
        std::set_intersection(current.begin(), current.end(),
                              lists[i]->begin(), lists[i]->end(),
                              std::back_inserter(next));
        current.swap(next);
    }
    return current.size();
}

Support support_of(const TransactionStore& store, const std::vector<std::string>& labels) {
    auto itemset = store.encode(labels);
    if (!itemset) return 0;
    return support(*itemset, store.get_index());
}
