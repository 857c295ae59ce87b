#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "algorithm_factory.h"
#include "signal_handler.h"
#include "errors.h"
#include "test_helpers.h"

using namespace test_helpers;

TEST (AprioriMinerTest, TextbookTable) {
  TransactionStore store = make_store(textbook_rows());
  AprioriMiner miner;
  FrequentItemsetTable table = miner.mine(store, MiningParams{3});
  EXPECT_EQ(count_itemsets(table), 19u);
  EXPECT_EQ(table.at(4), (LevelMap{{itemset_of(store, "ABDE"), 3}}));
  EXPECT_EQ(table.at(3).at(itemset_of(store, "ABE")), 4u);
}

// Both search strategies must agree on every input.
TEST (AprioriMinerTest, AgreesWithDepthFirstMiner) {
  DfsMiner dfs;
  AprioriMiner apriori;
  for (unsigned seed = 10; seed < 20; ++seed) {
    TransactionStore store = make_store(random_rows(seed, 80, 10, 7));
    for (int min_support : {0, 2, 5, 10, 40}) {
      if (min_support == 0 && store.num_items() > 10) continue;
      MiningParams params{min_support};
      EXPECT_EQ(dfs.mine(store, params), apriori.mine(store, params))
          << "seed " << seed << " min_support " << min_support;
    }
  }
}

TEST (AprioriMinerTest, EmptyAndUnreachable) {
  AprioriMiner miner;
  EXPECT_TRUE(miner.mine(make_store({}), MiningParams{1}).empty());
  EXPECT_TRUE(miner.mine(make_store({"AB", "A"}), MiningParams{3}).empty());
  EXPECT_THROW(miner.mine(make_store({"AB"}), MiningParams{-2}), InvalidThresholdError);
}

TEST (AprioriMinerTest, StopRequestInterruptsMining) {
  AprioriMiner miner;
  TransactionStore store = make_store(textbook_rows());
  g_stop_requested = true;
  EXPECT_THROW(miner.mine(store, MiningParams{2}), MiningInterruptedError);
  g_stop_requested = false;
}

TEST (AlgorithmFactoryTest, ByName) {
  EXPECT_EQ(make_algorithm(parse_algorithm_kind("dfs"))->name(), "dfs");
  EXPECT_EQ(make_algorithm(parse_algorithm_kind("default"))->name(), "dfs");
  EXPECT_EQ(make_algorithm(parse_algorithm_kind("apriori"))->name(), "apriori");
  EXPECT_EQ(make_algorithm(parse_algorithm_kind("bfs"))->name(), "apriori");
  EXPECT_THROW(parse_algorithm_kind("fpgrowth"), ConfigError);
}
