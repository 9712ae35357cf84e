// compdoc/model/document.hpp - Document entity as read from the store
#pragma once

#include <map>
#include <optional>
#include <string>

namespace compdoc
{

using DocumentId = std::string;
using GroupId = std::string;
using ProjectId = std::string;

/// Token key -> reference string. Ordered so traversals are deterministic.
using ComponentMap = std::map<std::string, std::string>;

/**
 * A document owned by the document store.
 *
 * The resolution engine only ever reads documents.
 */
struct Document
{
  DocumentId id;
  ProjectId project_id;
  std::string title;

  /// Template body; may contain {{key}} tokens
  std::string content;

  /// Local component map used to resolve this document's tokens
  ComponentMap components;

  std::optional<GroupId> group_id;
  std::optional<std::string> document_type;

  /// ISO-8601 timestamp; ordered by its UTC instant (see parse_timestamp)
  std::string created_at;

  [[nodiscard]] bool is_composite() const noexcept { return !components.empty(); }
};

}  // namespace compdoc
