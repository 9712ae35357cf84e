// tests/unit/driver/test_context_assembler.cpp - Prompt context assembly

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "compdoc/driver/context_assembler.hpp"
#include "compdoc/test_support/store_helpers.hpp"

using namespace compdoc;
using test_support::k_test_project;
using test_support::make_document;
using test_support::make_group_member;
using test_support::TestStore;

namespace
{

Document titled(Document doc, std::string title, std::optional<std::string> type = std::nullopt)
{
  doc.title = std::move(title);
  doc.document_type = std::move(type);
  return doc;
}

}  // namespace

TEST(DriverContextAssembler, TokenEstimateRoundsUp)
{
  EXPECT_EQ(estimate_tokens(""), 0u);
  EXPECT_EQ(estimate_tokens("abc"), 1u);
  EXPECT_EQ(estimate_tokens("abcd"), 1u);
  EXPECT_EQ(estimate_tokens("abcde"), 2u);
}

TEST(DriverContextAssembler, PrimarySectionFormat)
{
  TestStore store;
  store.add(titled(make_document("P", "Hello {{who}}", {{"who", "W"}}), "Intro", "chapter"))
    .add("W", "world");

  const ContextAssembler assembler(store);
  ContextOptions options;
  options.include_related = false;
  const AssembledContext result = assembler.assemble(k_test_project, "P", {}, options);

  ASSERT_TRUE(result.success);
  const std::string expected =
    "=== Primary Document: Intro ===\nType: chapter\nContent:\nHello world";
  EXPECT_EQ(result.context, expected);
  EXPECT_EQ(result.documents_used, (std::vector<DocumentId>{"P"}));
  EXPECT_EQ(result.token_count, estimate_tokens(expected));
}

TEST(DriverContextAssembler, AdditionalDocumentsFollowPrimary)
{
  TestStore store;
  store.add(titled(make_document("P", "p"), "Primary"))
    .add(titled(make_document("X", "x"), "Extra"))
    .add(make_document("F", "foreign", {}, "other"));

  const ContextAssembler assembler(store);
  ContextOptions options;
  options.include_related = false;
  const AssembledContext result =
    assembler.assemble(k_test_project, "P", {"X", "missing", "F"}, options);

  EXPECT_EQ(
    result.context,
    "=== Primary Document: Primary ===\nContent:\np\n\n"
    "=== Additional Context: Extra ===\nContent:\nx");
  EXPECT_EQ(result.documents_used, (std::vector<DocumentId>{"P", "X"}));
}

TEST(DriverContextAssembler, RelatedDocumentsAreRanked)
{
  TestStore store;
  Document primary = make_group_member("P", "G", std::nullopt, "2024-01-01T00:00:00Z", "{{r}}");
  primary.components = {{"r", "R"}, {"g", "group:G"}};
  store.add(primary)
    .add(make_group_member("S", "G", std::nullopt, "2024-01-02T00:00:00Z", "sibling"))
    .add(titled(make_document("T", "typed"), "T", "lore"))
    .add(make_document("R", "referenced"))
    .add(make_document("U", "unrelated"));

  const ContextAssembler assembler(store);
  ContextOptions options;
  options.preferred_types = {"lore"};
  const AssembledContext result = assembler.assemble(k_test_project, "P", {}, options);

  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.documents_used, (std::vector<DocumentId>{"P", "S", "T", "R"}));
  EXPECT_NE(
    result.context.find("=== Related Context: S ===\nContent:\nsibling"), std::string::npos);
}

TEST(DriverContextAssembler, RelatedLimitAndExclusions)
{
  TestStore store;
  store.add(make_group_member("P", "G", std::nullopt, "2024-01-01T00:00:00Z", "p"));
  for (int i = 0; i < 8; ++i) {
    const std::string id = "m" + std::to_string(i);
    store.add(make_group_member(id, "G", std::nullopt, "2024-02-0" + std::to_string(i + 1), id));
  }

  const ContextAssembler assembler(store);
  ContextOptions options;
  options.related_limit = 3;
  const AssembledContext result = assembler.assemble(k_test_project, "P", {"m0"}, options);

  // m0 is already used as additional context, so related starts at m1.
  EXPECT_EQ(result.documents_used, (std::vector<DocumentId>{"P", "m0", "m1", "m2", "m3"}));
}

TEST(DriverContextAssembler, SectionsThatDoNotFitAreSkipped)
{
  TestStore store;
  store.add(titled(make_document("P", "p"), "P"))
    .add(titled(make_document("Big", std::string(400, 'x')), "Big"))
    .add(titled(make_document("Small", "s"), "Small"));

  const ContextAssembler assembler(store);
  ContextOptions options;
  options.include_related = false;
  options.max_tokens = 40;
  const AssembledContext result =
    assembler.assemble(k_test_project, "P", {"Big", "Small"}, options);

  EXPECT_EQ(result.documents_used, (std::vector<DocumentId>{"P", "Small"}));
  EXPECT_LE(result.token_count, 40u);
}

TEST(DriverContextAssembler, MissingPrimaryFails)
{
  TestStore store;
  store.add(make_document("F", "foreign", {}, "other"));

  const ContextAssembler assembler(store);
  EXPECT_FALSE(assembler.assemble(k_test_project, "missing", {}).success);

  const AssembledContext foreign = assembler.assemble(k_test_project, "F", {});
  EXPECT_FALSE(foreign.success);
  EXPECT_TRUE(foreign.diagnostics.contains(diag_code::k_unknown_document));
}

TEST(DriverContextAssembler, ResolutionWarningsAreCollected)
{
  TestStore store;
  store.add("P", "{{gone}}", {{"gone", "ghost"}});

  const ContextAssembler assembler(store);
  const AssembledContext result = assembler.assemble(k_test_project, "P", {});
  ASSERT_TRUE(result.success);
  EXPECT_NE(result.context.find("Content:\n{{gone}}"), std::string::npos);
  EXPECT_TRUE(result.diagnostics.contains(diag_code::k_missing_document));
}
