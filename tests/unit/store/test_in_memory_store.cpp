// tests/unit/store/test_in_memory_store.cpp - In-memory document store

#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "compdoc/test_support/store_helpers.hpp"

using namespace compdoc;
using test_support::make_document;
using test_support::make_group_member;
using test_support::TestStore;

TEST(StoreInMemory, PutReplacesAndEraseRemoves)
{
  TestStore store;
  store.add("A", "one");
  store.add("A", "two");

  EXPECT_EQ(store.size(), 1u);
  EXPECT_EQ(store.get_document("A")->content, "two");

  EXPECT_TRUE(store.erase("A"));
  EXPECT_FALSE(store.erase("A"));
  EXPECT_FALSE(store.get_document("A").has_value());
}

TEST(StoreInMemory, SetComponentsRequiresExistingDocument)
{
  TestStore store;
  store.add("A", "{{x}}");

  EXPECT_TRUE(store.set_components("A", {{"x", "B"}}));
  EXPECT_EQ(store.get_document("A")->components.at("x"), "B");
  EXPECT_FALSE(store.set_components("missing", {{"x", "B"}}));
}

TEST(StoreInMemory, ListingsAreSortedById)
{
  TestStore store;
  store.add(make_group_member("c", "G", std::nullopt, "2024-01-01T00:00:00Z"))
    .add(make_group_member("a", "G", std::nullopt, "2024-01-03T00:00:00Z"))
    .add(make_group_member("b", "H", std::nullopt, "2024-01-02T00:00:00Z"))
    .add(make_document("z", "", {}, "other"));

  const auto members = store.get_group_members("G");
  ASSERT_EQ(members.size(), 2u);
  EXPECT_EQ(members[0].id, "a");
  EXPECT_EQ(members[1].id, "c");

  const auto project = store.documents_in_project(test_support::k_test_project);
  ASSERT_EQ(project.size(), 3u);
  EXPECT_EQ(project[0].id, "a");
  EXPECT_EQ(project[2].id, "c");

  EXPECT_TRUE(store.get_group_members("none").empty());
}

TEST(StoreInMemory, ReadersSeeWholeDocuments)
{
  TestStore store;
  store.add("A", "v0");

  std::atomic<bool> stop{false};
  std::thread writer([&] {
    for (int i = 0; i < 2000; ++i) {
      store.add("A", "v" + std::to_string(i % 2));
    }
    stop = true;
  });

  while (!stop) {
    const auto doc = store.get_document("A");
    EXPECT_TRUE(doc.has_value());
    if (doc) {
      EXPECT_TRUE(doc->content == "v0" || doc->content == "v1") << doc->content;
    }
  }
  writer.join();
}
