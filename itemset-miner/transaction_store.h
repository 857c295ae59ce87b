#ifndef TRANSACTION_STORE_H
#define TRANSACTION_STORE_H

#include <vector>
#include <string>
#include <optional>
#include <unordered_map>
#include "types.h"

// Builds the posting lists for every item id seen in transactions.
// An empty collection yields an empty index unless require_non_empty is set,
// in which case EmptyInputError is thrown.
InvertedIndex build_index(const std::vector<Transaction>& transactions,
                          size_t num_items,
                          bool require_non_empty = false);

// Immutable, dictionary-encoded transaction collection plus its inverted index.
// Item ids are assigned in lexicographic label order, so comparing ids
// compares labels.
class TransactionStore {
private:
    std::vector<std::string> id_to_item;
    std::unordered_map<std::string, ItemId> item_to_id;
    std::vector<Transaction> transactions;
    InvertedIndex index;

public:
    TransactionStore() = default;
    explicit TransactionStore(const std::vector<std::vector<std::string>>& labelled,
                              bool require_non_empty = false);

    size_t num_transactions() const { return transactions.size(); }
    size_t num_items() const { return id_to_item.size(); }

    const std::vector<Transaction>& get_transactions() const { return transactions; }
    const InvertedIndex& get_index() const { return index; }
    const std::vector<std::string>& get_id_to_item() const { return id_to_item; }

    const std::string& label(ItemId id) const { return id_to_item.at(id); }
    std::optional<ItemId> find_item(const std::string& item) const;

    // Canonical itemset for the given labels, or nothing if any label never occurs.
    std::optional<Itemset> encode(const std::vector<std::string>& labels) const;
    std::vector<std::string> decode(const Itemset& itemset) const;
};

#endif // TRANSACTION_STORE_H
