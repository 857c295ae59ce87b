#include "transaction_store.h"
#include "errors.h"
#include <algorithm>
#include <execution>
#include <omp.h>

InvertedIndex build_index(const std::vector<Transaction>& transactions,
                          size_t num_items,
                          bool require_non_empty) {
    if (require_non_empty && transactions.empty()) {
        throw EmptyInputError("Transaction collection is empty");
    }

    InvertedIndex idx;
    idx.num_transactions = transactions.size();
    idx.postings.resize(num_items);

    for (size_t tid = 0; tid < transactions.size(); ++tid) {
        for (ItemId item : transactions[tid]) {
            if (item >= idx.postings.size()) idx.postings.resize(item + 1);
            auto& list = idx.postings[item];
            // transactions are visited in order, so a repeat can only be at the back
            if (list.empty() || list.back() != (TransactionId)tid) {
                list.push_back((TransactionId)tid);
            }
        }
    }
    return idx;
}

TransactionStore::TransactionStore(const std::vector<std::vector<std::string>>& labelled,
                                   bool require_non_empty) {
    // Phase I: dictionary in label order
    std::vector<std::string> all_items;
    for (const auto& row : labelled) {
        all_items.insert(all_items.end(), row.begin(), row.end());
    }
    std::sort(std::execution::par, all_items.begin(), all_items.end());
    all_items.erase(std::unique(all_items.begin(), all_items.end()), all_items.end());

    id_to_item = std::move(all_items);
    item_to_id.reserve(id_to_item.size());
    for (size_t i = 0; i < id_to_item.size(); ++i) {
        item_to_id.emplace(id_to_item[i], (ItemId)i);
    }

    // Phase II: encode every row into a canonical sorted set
    size_t n = labelled.size();
    transactions.assign(n, Transaction{});

    #pragma omp parallel for schedule(static)
    for (size_t i = 0; i < n; ++i) {
        Transaction encoded;
        encoded.reserve(labelled[i].size());
        for (const auto& item : labelled[i]) {
            encoded.push_back(item_to_id.find(item)->second);
        }
        std::sort(encoded.begin(), encoded.end());
        encoded.erase(std::unique(encoded.begin(), encoded.end()), encoded.end());
        transactions[i] = std::move(encoded);
    }

    index = build_index(transactions, id_to_item.size(), require_non_empty);
}

std::optional<ItemId> TransactionStore::find_item(const std::string& item) const {
    auto it = item_to_id.find(item);
    if (it == item_to_id.end()) return std::nullopt;
    return it->second;
}

std::optional<Itemset> TransactionStore::encode(const std::vector<std::string>& labels) const {
    Itemset itemset;
    itemset.reserve(labels.size());
    for (const auto& l : labels) {
        auto id = find_item(l);
        if (!id) return std::nullopt;
        itemset.push_back(*id);
    }
    std::sort(itemset.begin(), itemset.end());
    itemset.erase(std::unique(itemset.begin(), itemset.end()), itemset.end());
    return itemset;
}

std::vector<std::string> TransactionStore::decode(const Itemset& itemset) const {
    std::vector<std::string> labels;
    labels.reserve(itemset.size());
    for (ItemId id : itemset) labels.push_back(label(id));
    return labels;
}
