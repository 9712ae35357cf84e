// compdoc/store/document_store.hpp - Document store collaborator interface
//
// The engine treats the store as an external key-value service and consumes
// exactly two operations from it. Implementations may be mutated concurrently
// by other actors; every call returns a snapshot.
//
#pragma once

#include <optional>
#include <vector>

#include "compdoc/model/document.hpp"

namespace compdoc
{

class DocumentStore
{
public:
  virtual ~DocumentStore() = default;

  /// Fetch a document by id.
  [[nodiscard]] virtual std::optional<Document> get_document(const DocumentId & id) const = 0;

  /// Fetch every document whose group id equals `group_id` (any order).
  [[nodiscard]] virtual std::vector<Document> get_group_members(const GroupId & group_id) const = 0;
};

/**
 * A store that can also enumerate a project. Only prompt-context assembly
 * needs this; resolution and validation use DocumentStore alone.
 */
class DocumentCatalog : public DocumentStore
{
public:
  [[nodiscard]] virtual std::vector<Document> documents_in_project(
    const ProjectId & project_id) const = 0;
};

}  // namespace compdoc
