// compdoc/sema/expander.hpp - Read-time composite document expansion
//
// Walks the reference graph depth-first and substitutes each resolved token
// with the fully expanded content of its target document.
//
// Expansion is best-effort: unresolved tokens, malformed references, empty
// groups, missing documents, suppressed cycles and exhausted limits all leave
// the literal token text in place and record a warning. Nothing is written to
// the store; group choices that a caller may want to memoise are returned in
// ExpansionResult::resolution_cache.
//
#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "compdoc/basic/diagnostic.hpp"
#include "compdoc/model/document.hpp"
#include "compdoc/model/overrides.hpp"
#include "compdoc/sema/group_selector.hpp"
#include "compdoc/store/document_store.hpp"

namespace compdoc
{

struct ExpansionLimits
{
  /// Maximum nesting below the document being resolved
  size_t max_depth = 64;
  /// Maximum number of documents expanded in one call
  size_t max_expansions = 4096;
};

struct ExpanderOptions
{
  ExpansionLimits limits;
  GroupOrder group_order = GroupOrder::OldestFirst;
};

/// document id -> (token key -> concrete document id chosen for a group reference)
using ResolutionCache = std::map<DocumentId, std::map<std::string, DocumentId>>;

struct ExpansionResult
{
  std::string text;

  /// Group references from component maps, resolved to concrete ids
  ResolutionCache resolution_cache;

  /// Documents expanded during the call, in first-use order
  std::vector<DocumentId> documents_used;
};

/**
 * Expands token references within one project.
 *
 * Traversal uses an explicit frame stack, so nesting is bounded by
 * ExpansionLimits rather than by the call stack. Document ids are interned
 * into an arena and the active path is an index-addressed flag vector; a
 * target already on the path is never expanded again, which guarantees
 * termination even on cyclic data.
 *
 * Within one body, every occurrence of the same token key is substituted with
 * the same expansion.
 */
class Expander
{
public:
  Expander(
    const DocumentStore & store, ProjectId project_id, ExpanderOptions options = {},
    DiagnosticBag * diags = nullptr)
  : store_(store), project_id_(std::move(project_id)), options_(options), diags_(diags)
  {
  }

  /**
   * Expand `body` as the content of `current_document_id`.
   *
   * @param body Template text to expand
   * @param local_components Component map of the current document
   * @param overrides Caller overrides, applied unchanged at every depth
   * @param current_document_id Identity used for namespaced overrides
   * @param visited Ids already on the active path (normally {current_document_id})
   */
  [[nodiscard]] ExpansionResult expand(
    const std::string & body, const ComponentMap & local_components, const OverrideSet & overrides,
    const DocumentId & current_document_id, const std::vector<DocumentId> & visited);

  [[nodiscard]] size_t warning_count() const noexcept { return warning_count_; }

private:
  const DocumentStore & store_;
  ProjectId project_id_;
  ExpanderOptions options_;
  DiagnosticBag * diags_ = nullptr;
  size_t warning_count_ = 0;
};

}  // namespace compdoc
