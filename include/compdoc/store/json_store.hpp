// compdoc/store/json_store.hpp - JSON document snapshots
//
// Loads a project snapshot into an InMemoryDocumentStore:
//
//   {"documents": [{"id": "...", "project_id": "...", "title": "...",
//                   "content": "...", "components": {"key": "ref"},
//                   "group_id": "...", "document_type": "...",
//                   "created_at": "2025-01-01T00:00:00Z"}]}
//
#pragma once

#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

#include "compdoc/model/document.hpp"
#include "compdoc/store/in_memory_store.hpp"

namespace compdoc
{

/**
 * Result of loading a document snapshot.
 */
struct StoreLoadResult
{
  /// Loaded store (only valid if success == true)
  std::unique_ptr<InMemoryDocumentStore> store;

  bool success = false;
  std::string error;

  static StoreLoadResult ok(std::unique_ptr<InMemoryDocumentStore> s)
  {
    StoreLoadResult r;
    r.store = std::move(s);
    r.success = true;
    return r;
  }

  static StoreLoadResult fail(std::string msg)
  {
    StoreLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

/// Load a snapshot file.
[[nodiscard]] StoreLoadResult load_document_store(const std::filesystem::path & path);

/// Load a snapshot from JSON text.
[[nodiscard]] StoreLoadResult load_document_store_from_string(std::string_view text);

/// Decode one document object; sets `error` and returns std::nullopt when invalid.
[[nodiscard]] std::optional<Document> document_from_json(
  const nlohmann::json & j, std::string & error);

[[nodiscard]] nlohmann::json to_json(const Document & doc);

}  // namespace compdoc
