#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "transaction_store.h"
#include "errors.h"
#include "test_helpers.h"

using namespace test_helpers;

TEST (TransactionStoreTest, IdsFollowLabelOrder) {
  TransactionStore store = make_store({"CB", "A", "BD"});
  ASSERT_EQ(store.num_items(), 4u);
  EXPECT_EQ(store.get_id_to_item(), (std::vector<std::string>{"A", "B", "C", "D"}));
  EXPECT_EQ(*store.find_item("A"), 0u);
  EXPECT_EQ(*store.find_item("D"), 3u);
  EXPECT_FALSE(store.find_item("Z").has_value());
  EXPECT_EQ(store.label(2), "C");
}

TEST (TransactionStoreTest, TransactionsAreCanonical) {
  TransactionStore store = make_store({"CBCA", ""});
  ASSERT_EQ(store.num_transactions(), 2u);
  EXPECT_EQ(store.get_transactions()[0], (Transaction{0, 1, 2}));
  EXPECT_TRUE(store.get_transactions()[1].empty());
}

TEST (TransactionStoreTest, IndexListsContainingTransactions) {
  TransactionStore store = make_store(textbook_rows());
  const InvertedIndex& index = store.get_index();
  EXPECT_EQ(index.num_transactions, 6u);
  EXPECT_EQ(index.postings_for(*store.find_item("A")), (PostingList{0, 2, 3, 4}));
  EXPECT_EQ(index.postings_for(*store.find_item("B")), (PostingList{0, 1, 2, 3, 4, 5}));
  EXPECT_EQ(index.postings_for(*store.find_item("C")), (PostingList{1, 3, 4, 5}));
  EXPECT_TRUE(index.postings_for(99).empty());

  // index[item] == {i : item in transactions[i]}
  const auto& transactions = store.get_transactions();
  for (ItemId item = 0; item < store.num_items(); ++item) {
    PostingList expected;
    for (size_t tid = 0; tid < transactions.size(); ++tid) {
      if (std::binary_search(transactions[tid].begin(), transactions[tid].end(), item)) {
        expected.push_back((TransactionId)tid);
      }
    }
    EXPECT_EQ(index.postings_for(item), expected) << "item " << store.label(item);
  }
}

TEST (TransactionStoreTest, BuildIndexFromEncodedTransactions) {
  std::vector<Transaction> transactions = {{0, 2}, {2}, {}};
  InvertedIndex index = build_index(transactions, 3);
  ASSERT_EQ(index.postings.size(), 3u);
  EXPECT_EQ(index.postings[0], (PostingList{0}));
  EXPECT_TRUE(index.postings[1].empty());
  EXPECT_EQ(index.postings[2], (PostingList{0, 1}));
  EXPECT_EQ(index.num_transactions, 3u);
}

TEST (TransactionStoreTest, EmptyCollection) {
  TransactionStore store = make_store({});
  EXPECT_EQ(store.num_transactions(), 0u);
  EXPECT_EQ(store.num_items(), 0u);
  EXPECT_TRUE(store.get_index().postings.empty());
}

TEST (TransactionStoreTest, EmptyCollectionRejectedWhenRequired) {
  std::vector<std::vector<std::string>> none;
  EXPECT_THROW({ TransactionStore store(none, true); }, EmptyInputError);
  EXPECT_THROW(build_index(std::vector<Transaction>{}, 0, true), EmptyInputError);
  EXPECT_NO_THROW({ TransactionStore store(char_rows({"A"}), true); });
}

TEST (TransactionStoreTest, EncodeAndDecode) {
  TransactionStore store = make_store({"AB", "C"});
  auto encoded = store.encode({"C", "A", "C"});
  ASSERT_TRUE(encoded.has_value());
  EXPECT_EQ(*encoded, (Itemset{0, 2}));
  EXPECT_EQ(store.decode(*encoded), (std::vector<std::string>{"A", "C"}));
  EXPECT_FALSE(store.encode({"A", "Q"}).has_value());
}
