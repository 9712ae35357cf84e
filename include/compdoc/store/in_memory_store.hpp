// compdoc/store/in_memory_store.hpp - Thread-safe in-memory document store
#pragma once

#include <shared_mutex>
#include <unordered_map>

#include "compdoc/store/document_store.hpp"

namespace compdoc
{

/**
 * Document store backed by a hash map.
 *
 * Reads take a shared lock and return copies, so a reader always works on a
 * snapshot even while another thread calls put() or erase().
 */
class InMemoryDocumentStore : public DocumentCatalog
{
public:
  InMemoryDocumentStore() = default;

  InMemoryDocumentStore(const InMemoryDocumentStore &) = delete;
  InMemoryDocumentStore & operator=(const InMemoryDocumentStore &) = delete;

  // ===========================================================================
  // DocumentCatalog
  // ===========================================================================

  [[nodiscard]] std::optional<Document> get_document(const DocumentId & id) const override;
  [[nodiscard]] std::vector<Document> get_group_members(const GroupId & group_id) const override;
  [[nodiscard]] std::vector<Document> documents_in_project(
    const ProjectId & project_id) const override;

  // ===========================================================================
  // Mutation
  // ===========================================================================

  /// Insert or replace a document (keyed by id).
  void put(Document doc);

  /// Remove a document; returns false if it did not exist.
  bool erase(const DocumentId & id);

  /// Replace the component map of an existing document.
  bool set_components(const DocumentId & id, ComponentMap components);

  [[nodiscard]] size_t size() const;

private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<DocumentId, Document> documents_;
};

}  // namespace compdoc
