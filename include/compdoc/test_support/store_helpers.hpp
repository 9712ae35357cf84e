// compdoc/test_support/store_helpers.hpp - helpers for unit/integration tests
//
// Small builders for documents and populated in-memory stores.
//
#pragma once

#include <optional>
#include <string>
#include <utility>

#include "compdoc/model/document.hpp"
#include "compdoc/store/in_memory_store.hpp"

namespace compdoc::test_support
{

inline constexpr const char * k_test_project = "proj-1";

[[nodiscard]] inline Document make_document(
  std::string id, std::string content, ComponentMap components = {},
  std::string project_id = k_test_project)
{
  Document doc;
  doc.id = std::move(id);
  doc.title = doc.id;
  doc.content = std::move(content);
  doc.components = std::move(components);
  doc.project_id = std::move(project_id);
  doc.created_at = "2024-01-01T00:00:00Z";
  return doc;
}

[[nodiscard]] inline Document make_group_member(
  std::string id, std::string group_id, std::optional<std::string> type, std::string created_at,
  std::string content = "")
{
  Document doc = make_document(std::move(id), std::move(content));
  doc.group_id = std::move(group_id);
  doc.document_type = std::move(type);
  doc.created_at = std::move(created_at);
  return doc;
}

/**
 * InMemoryDocumentStore with a fluent add().
 */
class TestStore : public InMemoryDocumentStore
{
public:
  TestStore & add(Document doc)
  {
    put(std::move(doc));
    return *this;
  }

  TestStore & add(std::string id, std::string content, ComponentMap components = {})
  {
    return add(make_document(std::move(id), std::move(content), std::move(components)));
  }
};

}  // namespace compdoc::test_support
