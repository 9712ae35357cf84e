// tests/unit/store/test_json_store.cpp - JSON snapshot loading

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "compdoc/sema/group_selector.hpp"
#include "compdoc/store/json_store.hpp"

using namespace compdoc;
namespace fs = std::filesystem;

TEST(StoreJsonSnapshot, LoadsDocuments)
{
  const auto result = load_document_store_from_string(R"({
    "documents": [
      {"id": "A", "project_id": "p", "title": "Alpha", "content": "{{x}}",
       "components": {"x": "B"}, "created_at": "2024-01-01T00:00:00Z"},
      {"id": "B", "project_id": "p", "title": "Beta", "content": "bee",
       "group_id": "G", "document_type": "lore", "created_at": "2024-01-02T00:00:00Z"}
    ]
  })");

  ASSERT_TRUE(result.success) << result.error;
  ASSERT_NE(result.store, nullptr);
  EXPECT_EQ(result.store->size(), 2u);

  const auto a = result.store->get_document("A");
  ASSERT_TRUE(a.has_value());
  EXPECT_EQ(a->title, "Alpha");
  EXPECT_TRUE(a->is_composite());
  EXPECT_EQ(a->components.at("x"), "B");
  EXPECT_FALSE(a->group_id.has_value());

  const auto members = result.store->get_group_members("G");
  ASSERT_EQ(members.size(), 1u);
  EXPECT_EQ(members[0].id, "B");
  EXPECT_EQ(members[0].document_type, std::optional<std::string>("lore"));
}

TEST(StoreJsonSnapshot, EmptyGroupAndTypeStringsMeanAbsent)
{
  const auto result = load_document_store_from_string(
    R"({"documents": [{"id": "A", "project_id": "p", "group_id": "", "document_type": "",
        "components": null}]})");

  ASSERT_TRUE(result.success) << result.error;
  const auto a = result.store->get_document("A");
  ASSERT_TRUE(a.has_value());
  EXPECT_FALSE(a->group_id.has_value());
  EXPECT_FALSE(a->document_type.has_value());
  EXPECT_FALSE(a->is_composite());
}

TEST(StoreJsonSnapshot, RejectsInvalidInput)
{
  EXPECT_FALSE(load_document_store_from_string("not json").success);
  EXPECT_FALSE(load_document_store_from_string("[]").success);
  EXPECT_FALSE(load_document_store_from_string(R"({"documents": {}})").success);
  EXPECT_FALSE(load_document_store_from_string(R"({"documents": [{"title": "no id"}]})").success);
  EXPECT_FALSE(
    load_document_store_from_string(R"({"documents": [{"id": "A", "components": {"x": 1}}]})")
      .success);
  EXPECT_FALSE(load_document_store_from_string(R"({"documents": [{"id": 7}]})").success);
}

TEST(StoreJsonSnapshot, RejectsMalformedCreationTime)
{
  const auto result = load_document_store_from_string(
    R"({"documents": [{"id": "A", "created_at": "last tuesday"}]})");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("'created_at' is not an ISO-8601 timestamp"), std::string::npos);
}

TEST(StoreJsonSnapshot, MixedTimestampFormatsOrderByInstant)
{
  const auto result = load_document_store_from_string(R"({
    "documents": [
      {"id": "whole", "project_id": "p", "group_id": "G", "created_at": "2024-01-01T10:00:00Z"},
      {"id": "frac", "project_id": "p", "group_id": "G",
       "created_at": "2024-01-01T10:00:00.500Z"},
      {"id": "offset", "project_id": "p", "group_id": "G",
       "created_at": "2024-01-01T10:30:00+01:00"}
    ]
  })");
  ASSERT_TRUE(result.success) << result.error;

  auto members = result.store->get_group_members("G");
  sort_group_members(members, GroupOrder::OldestFirst);
  ASSERT_EQ(members.size(), 3u);
  EXPECT_EQ(members[0].id, "offset");
  EXPECT_EQ(members[1].id, "whole");
  EXPECT_EQ(members[2].id, "frac");
  // The text is kept as written.
  EXPECT_EQ(members[0].created_at, "2024-01-01T10:30:00+01:00");
}

TEST(StoreJsonSnapshot, RejectsDuplicateIds)
{
  const auto result =
    load_document_store_from_string(R"({"documents": [{"id": "A"}, {"id": "A"}]})");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("duplicate document id: 'A'"), std::string::npos);
}

TEST(StoreJsonSnapshot, DocumentRoundTripsThroughJson)
{
  Document doc;
  doc.id = "A";
  doc.project_id = "p";
  doc.title = "Alpha";
  doc.content = "{{x}}";
  doc.components = {{"x", "group:G:lore"}};
  doc.group_id = "G";
  doc.created_at = "2024-01-01T00:00:00Z";

  std::string error;
  const auto back = document_from_json(to_json(doc), error);
  ASSERT_TRUE(back.has_value()) << error;
  EXPECT_EQ(back->id, doc.id);
  EXPECT_EQ(back->components, doc.components);
  EXPECT_EQ(back->group_id, doc.group_id);
  EXPECT_FALSE(back->document_type.has_value());
  EXPECT_EQ(back->created_at, doc.created_at);
}

TEST(StoreJsonSnapshot, LoadsFromFile)
{
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  const fs::path path =
    fs::temp_directory_path() / ("compdoc_store_" + std::to_string(now) + ".json");
  {
    std::ofstream out(path);
    out << R"({"documents": [{"id": "A", "project_id": "p", "content": "a"}]})";
  }

  const auto result = load_document_store(path);
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.store->get_document("A")->content, "a");

  fs::remove(path);
  EXPECT_FALSE(load_document_store(path).success);
}
