// compdoc/driver/context_assembler.hpp - Prompt context assembly
//
// Gathers a primary document, explicitly requested documents and related
// documents into one text block under an approximate token budget.
//
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "compdoc/basic/diagnostic.hpp"
#include "compdoc/driver/engine.hpp"
#include "compdoc/model/document.hpp"
#include "compdoc/store/document_store.hpp"

namespace compdoc
{

struct ContextOptions
{
  bool include_related = true;

  /// Approximate token budget (see estimate_tokens)
  size_t max_tokens = 100000;

  /// Document types preferred when picking related documents
  std::vector<std::string> preferred_types;

  size_t related_limit = 5;
};

struct AssembledContext
{
  bool success = false;

  std::string context;

  /// Primary first, then every section that fit, in output order
  std::vector<DocumentId> documents_used;

  /// Sum of the estimated tokens of the included sections
  size_t token_count = 0;

  DiagnosticBag diagnostics;
};

/// Rough token estimate: one token per four characters, rounded up.
[[nodiscard]] constexpr size_t estimate_tokens(std::string_view text) noexcept
{
  return (text.size() + 3) / 4;
}

class ContextAssembler
{
public:
  explicit ContextAssembler(const DocumentCatalog & catalog, EngineOptions options = {})
  : catalog_(catalog), engine_(catalog, options)
  {
  }

  /**
   * Build the context for `primary_id`.
   *
   * The primary section is always included. Additional and related sections
   * are added in order while they fit in `options.max_tokens`; sections that
   * do not fit are skipped. Unknown additional ids are ignored.
   *
   * Related documents, at most `options.related_limit`, are ranked:
   * members of the primary's group, then documents of a preferred type, then
   * documents referenced directly by the primary's component map.
   */
  [[nodiscard]] AssembledContext assemble(
    const ProjectId & project_id, const DocumentId & primary_id,
    const std::vector<DocumentId> & additional_ids, const ContextOptions & options = {}) const;

private:
  [[nodiscard]] std::vector<Document> find_related(
    const ProjectId & project_id, const Document & primary,
    const std::vector<DocumentId> & exclude, const ContextOptions & options) const;

  [[nodiscard]] std::string resolve_content(const Document & doc, DiagnosticBag & diags) const;

  const DocumentCatalog & catalog_;
  Engine engine_;
};

}  // namespace compdoc
