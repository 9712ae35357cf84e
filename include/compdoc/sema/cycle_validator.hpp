// compdoc/sema/cycle_validator.hpp - Write-time cycle check for component maps
//
// Runs before a document's component map is created or changed. The proposed
// graph is rejected if any reference, followed through stored documents,
// leads back to the edited document or into any other cycle. Group references
// are expanded to every member, not just the representative, at every depth.
//
// Missing documents, documents of another project and malformed references
// are dangling: they cannot complete a cycle.
//
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "compdoc/basic/diagnostic.hpp"
#include "compdoc/model/document.hpp"
#include "compdoc/model/reference.hpp"
#include "compdoc/store/document_store.hpp"

namespace compdoc
{

/**
 * Why a proposed component map was rejected.
 */
struct CycleError
{
  /// Document whose component map was being written
  DocumentId document_id;

  /// Component key whose reference closes the cycle
  std::string component_key;

  /// The offending reference (direct document or group)
  Reference reference;

  /// For group references: the member that closes the cycle
  std::optional<DocumentId> member;

  /// Documents along the cycle; first and last entries are equal
  std::vector<DocumentId> path;

  [[nodiscard]] std::string message() const;
  [[nodiscard]] std::string path_string() const;
};

struct ValidationResult
{
  std::optional<CycleError> error;

  [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }

  static ValidationResult success() { return {}; }

  static ValidationResult fail(CycleError e)
  {
    ValidationResult r;
    r.error = std::move(e);
    return r;
  }
};

/**
 * Depth-first cycle detection over stored component maps.
 *
 * Node states are white (unvisited), gray (on the active path) and black
 * (fully explored). Reaching the edited document or a gray node is a cycle;
 * a black node is not explored again, so each document is fetched at most
 * once per validate() call.
 */
class CycleValidator
{
public:
  explicit CycleValidator(const DocumentStore & store, DiagnosticBag * diags = nullptr)
  : store_(store), diags_(diags)
  {
  }

  // ===========================================================================
  // Entry Point
  // ===========================================================================

  /**
   * Check that writing `proposed_components` to `document_id` keeps the
   * project's reference graph acyclic.
   *
   * Proposed components are checked in key order and the first failure is
   * returned.
   */
  [[nodiscard]] ValidationResult validate(
    const DocumentId & document_id, const ComponentMap & proposed_components,
    const ProjectId & project_id);

  // ===========================================================================
  // Error State
  // ===========================================================================

  [[nodiscard]] bool has_errors() const noexcept { return has_errors_; }
  [[nodiscard]] size_t error_count() const noexcept { return error_count_; }

  /// Documents fetched during the last validate() call
  [[nodiscard]] size_t fetch_count() const noexcept { return fetch_count_; }

private:
  const DocumentStore & store_;
  DiagnosticBag * diags_ = nullptr;
  bool has_errors_ = false;
  size_t error_count_ = 0;
  size_t fetch_count_ = 0;
};

}  // namespace compdoc
