#ifndef RESULT_PRINTER_H
#define RESULT_PRINTER_H

#include <ostream>
#include <string>
#include "types.h"
#include "summary_extractor.h"

class TransactionStore;

// "{A, B}" using the store's labels
std::string format_itemset(const TransactionStore& store, const Itemset& itemset);

void print_table(std::ostream& out, const TransactionStore& store, const FrequentItemsetTable& table);

void print_itemsets(std::ostream& out, const TransactionStore& store,
                    const std::string& title, const ItemsetSupportMap& itemsets);

void print_statistics(std::ostream& out, const FrequentItemsetTable& table,
                      const ItemsetSupportMap& maximal, const ItemsetSupportMap& closed);

#endif // RESULT_PRINTER_H
