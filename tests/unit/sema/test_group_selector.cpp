// tests/unit/sema/test_group_selector.cpp - Group representative selection

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "compdoc/sema/group_selector.hpp"
#include "compdoc/test_support/store_helpers.hpp"

using namespace compdoc;
using test_support::make_group_member;

TEST(SemaGroupSelector, RepresentativeWhenNoTypeGiven)
{
  const std::vector<Document> members{
    make_group_member("M1", "G", std::string("lore"), "2024-01-01T00:00:00Z"),
    make_group_member("G", "G", std::nullopt, "2024-02-01T00:00:00Z"),
  };

  EXPECT_EQ(select_group_member("G", std::nullopt, members), "G");
}

TEST(SemaGroupSelector, PreferredTypeWins)
{
  const std::vector<Document> members{
    make_group_member("M1", "G", std::string("lore"), "2024-01-01T00:00:00Z"),
    make_group_member("G", "G", std::nullopt, "2024-02-01T00:00:00Z"),
  };

  EXPECT_EQ(select_group_member("G", std::string("lore"), members), "M1");
}

TEST(SemaGroupSelector, MissingPreferredTypeFallsBackToRepresentative)
{
  const std::vector<Document> members{
    make_group_member("M1", "G", std::string("lore"), "2024-01-01T00:00:00Z"),
    make_group_member("G", "G", std::nullopt, "2024-02-01T00:00:00Z"),
  };

  EXPECT_EQ(select_group_member("G", std::string("summary"), members), "G");
}

TEST(SemaGroupSelector, FirstMemberByCreationTime)
{
  // Store order must not matter.
  const std::vector<Document> members{
    make_group_member("late", "G", std::nullopt, "2024-03-01T00:00:00Z"),
    make_group_member("early", "G", std::nullopt, "2024-01-01T00:00:00Z"),
  };

  EXPECT_EQ(select_group_member("G", std::nullopt, members), "early");
  EXPECT_EQ(select_group_member("G", std::nullopt, members, GroupOrder::NewestFirst), "late");
}

TEST(SemaGroupSelector, TiesBreakById)
{
  const std::vector<Document> members{
    make_group_member("b", "G", std::nullopt, "2024-01-01T00:00:00Z"),
    make_group_member("a", "G", std::nullopt, "2024-01-01T00:00:00Z"),
  };

  EXPECT_EQ(select_group_member("G", std::nullopt, members), "a");
  EXPECT_EQ(select_group_member("G", std::nullopt, members, GroupOrder::NewestFirst), "a");
}

TEST(SemaGroupSelector, PreferredTypePicksFirstMatchInOrder)
{
  const std::vector<Document> members{
    make_group_member("new-lore", "G", std::string("lore"), "2024-05-01T00:00:00Z"),
    make_group_member("old-lore", "G", std::string("lore"), "2024-01-01T00:00:00Z"),
  };

  EXPECT_EQ(select_group_member("G", std::string("lore"), members), "old-lore");
  EXPECT_EQ(
    select_group_member("G", std::string("lore"), members, GroupOrder::NewestFirst), "new-lore");
}

TEST(SemaGroupSelector, EmptyGroupSelectsNothing)
{
  EXPECT_FALSE(select_group_member("G", std::nullopt, {}).has_value());
  EXPECT_FALSE(select_group_member("G", std::string("lore"), {}).has_value());
}

TEST(SemaGroupSelector, AvailableTypesAreSortedAndDistinct)
{
  const std::vector<Document> members{
    make_group_member("a", "G", std::string("summary"), "2024-01-01T00:00:00Z"),
    make_group_member("b", "G", std::string("lore"), "2024-01-02T00:00:00Z"),
    make_group_member("c", "G", std::string("lore"), "2024-01-03T00:00:00Z"),
    make_group_member("d", "G", std::nullopt, "2024-01-04T00:00:00Z"),
  };

  EXPECT_EQ(available_types(members), (std::vector<std::string>{"lore", "summary"}));
}

TEST(SemaGroupSelector, OrdersByInstantAcrossPrecisionAndOffsets)
{
  // As strings, "...10:00:00Z" sorts after "...10:00:00.500Z" and the +01:00
  // entry sorts after the 09:30Z one.
  const std::vector<Document> precision{
    make_group_member("later", "G", std::nullopt, "2024-01-01T10:00:00.500Z"),
    make_group_member("earlier", "G", std::nullopt, "2024-01-01T10:00:00Z"),
  };
  EXPECT_EQ(select_group_member("G", std::nullopt, precision), "earlier");
  EXPECT_EQ(
    select_group_member("G", std::nullopt, precision, GroupOrder::NewestFirst), "later");

  const std::vector<Document> offsets{
    make_group_member("utc", "G", std::nullopt, "2024-01-01T09:30:00Z"),
    make_group_member("paris", "G", std::nullopt, "2024-01-01T10:00:00+01:00"),
  };
  EXPECT_EQ(select_group_member("G", std::nullopt, offsets), "paris");
  EXPECT_EQ(select_group_member("G", std::nullopt, offsets, GroupOrder::NewestFirst), "utc");
}

TEST(SemaGroupSelector, SameInstantInDifferentNotationTiesById)
{
  std::vector<Document> members{
    make_group_member("b", "G", std::nullopt, "2024-01-01T10:00:00Z"),
    make_group_member("a", "G", std::nullopt, "2024-01-01T12:00:00.000+02:00"),
  };

  sort_group_members(members, GroupOrder::OldestFirst);
  EXPECT_EQ(members[0].id, "a");
  EXPECT_EQ(members[1].id, "b");
}

TEST(SemaGroupSelector, UnreadableTimestampsSortLast)
{
  std::vector<Document> members{
    make_group_member("unknown", "G", std::nullopt, ""),
    make_group_member("old", "G", std::nullopt, "2023-06-01T00:00:00Z"),
    make_group_member("new", "G", std::nullopt, "2024-06-01T00:00:00Z"),
  };

  sort_group_members(members, GroupOrder::OldestFirst);
  EXPECT_EQ(members[0].id, "old");
  EXPECT_EQ(members[2].id, "unknown");

  sort_group_members(members, GroupOrder::NewestFirst);
  EXPECT_EQ(members[0].id, "new");
  EXPECT_EQ(members[2].id, "unknown");
}
