#include "result_printer.h"
#include "transaction_store.h"

std::string format_itemset(const TransactionStore& store, const Itemset& itemset) {
    std::string s = "{";
    for (size_t i = 0; i < itemset.size(); ++i) {
        s += store.label(itemset[i]);
        if (i + 1 < itemset.size()) s += ", ";
    }
    s += "}";
    return s;
}

void print_table(std::ostream& out, const TransactionStore& store, const FrequentItemsetTable& table) {
    out << "Frequent itemsets:" << "\n";
    if (table.empty()) {
        out << "  (none)\n";
        return;
    }
    for (const auto& [k, level] : table) {
        out << "Level " << k << " (" << level.size() << "):\n";
        for (const auto& [itemset, sup] : level) {
            out << "  " << format_itemset(store, itemset) << ": " << sup << "\n";
        }
    }
}

void print_itemsets(std::ostream& out, const TransactionStore& store,
                    const std::string& title, const ItemsetSupportMap& itemsets) {
    out << title << " (" << itemsets.size() << "):\n";
    if (itemsets.empty()) {
        out << "  (none)\n";
        return;
    }
    for (const auto& [itemset, sup] : itemsets) {
        out << "  " << format_itemset(store, itemset) << ": " << sup << "\n";
    }
}

void print_statistics(std::ostream& out, const FrequentItemsetTable& table,
                      const ItemsetSupportMap& maximal, const ItemsetSupportMap& closed) {
    size_t longest = table.empty() ? 0 : table.rbegin()->first;
    out << "\n========== RESULT STATISTICS ==========\n";
    out << "Frequent itemsets:            " << count_itemsets(table) << "\n";
    out << "Longest frequent itemset:     " << longest << "\n";
    out << "Maximal itemsets:             " << maximal.size() << "\n";
    out << "Closed itemsets:              " << closed.size() << "\n";
    out << "=======================================\n" << std::endl;
}
