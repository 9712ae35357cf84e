// compdoc/driver/engine.hpp - Resolution engine facade
//
// Single entry point for resolution and validation.
// Used by the CLI and the context assembler; can be embedded by a CRUD layer.
//
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "compdoc/basic/diagnostic.hpp"
#include "compdoc/model/document.hpp"
#include "compdoc/model/overrides.hpp"
#include "compdoc/sema/cycle_validator.hpp"
#include "compdoc/sema/expander.hpp"
#include "compdoc/store/document_store.hpp"

namespace compdoc
{

class InMemoryDocumentStore;
struct ProjectConfig;

// ============================================================================
// Engine Options
// ============================================================================

struct EngineOptions
{
  ExpanderOptions expander;

  /// Take limits and group order from a loaded project configuration
  [[nodiscard]] static EngineOptions from_config(const ProjectConfig & config);
};

// ============================================================================
// Results
// ============================================================================

struct ResolveResult
{
  /// False only when the requested document does not exist
  bool success = false;

  /// Fully expanded content (literal tokens left where expansion failed)
  std::string text;

  /// Read-time warnings, or E002 when the document is missing
  DiagnosticBag diagnostics;

  /// Group choices a caller may persist with apply_resolution_cache()
  ResolutionCache resolution_cache;

  /// Documents expanded below the root, in first-use order
  std::vector<DocumentId> documents_used;
};

/**
 * Result of resolving a group to one member.
 */
struct GroupResolution
{
  bool success = false;

  /// The chosen member (unset when the group is empty)
  std::optional<Document> selected;

  /// Selected member's content, expanded when it is composite
  std::string resolved_content;

  /// Distinct document types present in the group
  std::vector<std::string> available_types;

  DiagnosticBag diagnostics;
};

// ============================================================================
// Engine
// ============================================================================

/**
 * Read-time resolution and write-time validation over one document store.
 *
 * The engine holds no per-call state; concurrent calls on one instance are
 * safe as long as the store is.
 */
class Engine
{
public:
  explicit Engine(const DocumentStore & store, EngineOptions options = {})
  : store_(store), options_(options)
  {
  }

  /**
   * Resolve a stored document.
   *
   * Fetches the document, then expands its content with the visited path
   * seeded with the document itself. Only documents of the same project are
   * followed.
   */
  [[nodiscard]] ResolveResult resolve(
    const DocumentId & document_id, const OverrideSet & overrides = {}) const;

  /**
   * Check a proposed component map before it is written.
   *
   * @param diags Optional bag receiving E001/W007 diagnostics
   */
  [[nodiscard]] ValidationResult validate(
    const DocumentId & document_id, const ComponentMap & proposed_components,
    const ProjectId & project_id, DiagnosticBag * diags = nullptr) const;

  /**
   * Pick the representative of a group and return its resolved content.
   */
  [[nodiscard]] GroupResolution resolve_group(
    const ProjectId & project_id, const GroupId & group_id,
    const std::optional<std::string> & preferred_type = std::nullopt) const;

  [[nodiscard]] const EngineOptions & options() const noexcept { return options_; }

private:
  const DocumentStore & store_;
  EngineOptions options_;
};

/**
 * Persist memoised group choices as direct references.
 *
 * Each cached (document, key) pair overwrites that component with the chosen
 * member id. Documents that no longer exist are skipped.
 *
 * @return Number of component entries written
 */
size_t apply_resolution_cache(InMemoryDocumentStore & store, const ResolutionCache & cache);

}  // namespace compdoc
