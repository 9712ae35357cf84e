// compdoc/store/in_memory_store.cpp - In-memory document store
#include "compdoc/store/in_memory_store.hpp"

#include <algorithm>
#include <mutex>

namespace compdoc
{

namespace
{

// Hash-map iteration order is unspecified; listings are returned by id.
void sort_by_id(std::vector<Document> & docs)
{
  std::sort(docs.begin(), docs.end(), [](const Document & a, const Document & b) {
    return a.id < b.id;
  });
}

}  // namespace

std::optional<Document> InMemoryDocumentStore::get_document(const DocumentId & id) const
{
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto it = documents_.find(id);
  if (it == documents_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<Document> InMemoryDocumentStore::get_group_members(const GroupId & group_id) const
{
  std::vector<Document> out;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto & [id, doc] : documents_) {
      if (doc.group_id && *doc.group_id == group_id) {
        out.push_back(doc);
      }
    }
  }
  sort_by_id(out);
  return out;
}

std::vector<Document> InMemoryDocumentStore::documents_in_project(
  const ProjectId & project_id) const
{
  std::vector<Document> out;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto & [id, doc] : documents_) {
      if (doc.project_id == project_id) {
        out.push_back(doc);
      }
    }
  }
  sort_by_id(out);
  return out;
}

void InMemoryDocumentStore::put(Document doc)
{
  std::unique_lock<std::shared_mutex> lock(mutex_);
  DocumentId id = doc.id;
  documents_[std::move(id)] = std::move(doc);
}

bool InMemoryDocumentStore::erase(const DocumentId & id)
{
  std::unique_lock<std::shared_mutex> lock(mutex_);
  return documents_.erase(id) > 0;
}

bool InMemoryDocumentStore::set_components(const DocumentId & id, ComponentMap components)
{
  std::unique_lock<std::shared_mutex> lock(mutex_);
  const auto it = documents_.find(id);
  if (it == documents_.end()) {
    return false;
  }
  it->second.components = std::move(components);
  return true;
}

size_t InMemoryDocumentStore::size() const
{
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return documents_.size();
}

}  // namespace compdoc
