#include <sstream>
#include <string>

#include "gtest/gtest.h"

#include "result_printer.h"
#include "summary_extractor.h"
#include "dfs/dfs_miner.h"
#include "test_helpers.h"

using namespace test_helpers;

TEST (ResultPrinterTest, FormatItemsetUsesLabels) {
  TransactionStore store = make_store({"CAB"});
  EXPECT_EQ(format_itemset(store, itemset_of(store, "CA")), "{A, C}");
  EXPECT_EQ(format_itemset(store, Itemset{}), "{}");
}

TEST (ResultPrinterTest, TableAndSummaries) {
  TransactionStore store = make_store({"AB", "AB", "A"});
  DfsMiner miner;
  FrequentItemsetTable table = miner.mine(store, MiningParams{2});

  std::ostringstream ss;
  print_table(ss, store, table);
  print_itemsets(ss, store, "Maximal itemsets", maximal_itemsets(table));
  print_itemsets(ss, store, "Closed itemsets", closed_itemsets(table));

  std::string expected =
      "Frequent itemsets:\n"
      "Level 1 (2):\n"
      "  {A}: 3\n"
      "  {B}: 2\n"
      "Level 2 (1):\n"
      "  {A, B}: 2\n"
      "Maximal itemsets (1):\n"
      "  {A, B}: 2\n"
      "Closed itemsets (2):\n"
      "  {A}: 3\n"
      "  {A, B}: 2\n";
  EXPECT_EQ(ss.str(), expected);
}

TEST (ResultPrinterTest, EmptyResults) {
  TransactionStore store = make_store({});
  std::ostringstream ss;
  print_table(ss, store, FrequentItemsetTable{});
  print_itemsets(ss, store, "Maximal itemsets", ItemsetSupportMap{});
  EXPECT_EQ(ss.str(), "Frequent itemsets:\n  (none)\nMaximal itemsets (0):\n  (none)\n");
}

TEST (ResultPrinterTest, Statistics) {
  TransactionStore store = make_store(textbook_rows());
  DfsMiner miner;
  FrequentItemsetTable table = miner.mine(store, MiningParams{3});
  std::ostringstream ss;
  print_statistics(ss, table, maximal_itemsets(table), closed_itemsets(table));
  std::string out = ss.str();
  EXPECT_NE(out.find("Frequent itemsets:            19\n"), std::string::npos);
  EXPECT_NE(out.find("Longest frequent itemset:     4\n"), std::string::npos);
  EXPECT_NE(out.find("Maximal itemsets:             2\n"), std::string::npos);
  EXPECT_NE(out.find("Closed itemsets:              7\n"), std::string::npos);
}
