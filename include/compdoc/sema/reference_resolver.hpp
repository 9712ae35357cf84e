// compdoc/sema/reference_resolver.hpp - Token key -> reference lookup
//
// Precedence, highest first:
//   1. namespaced override  "<currentDocumentId>.<tokenKey>"
//   2. global override      "<tokenKey>"
//   3. the document's own component map
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "compdoc/model/document.hpp"
#include "compdoc/model/overrides.hpp"
#include "compdoc/model/reference.hpp"

namespace compdoc
{

/// Which layer supplied a reference.
enum class ReferenceSource : uint8_t {
  NamespacedOverride,
  GlobalOverride,
  LocalComponent,
};

struct ResolvedReference
{
  /// Raw stored value, kept for diagnostics
  std::string raw;
  /// Parsed form; std::nullopt when the raw value is malformed
  std::optional<Reference> reference;
  ReferenceSource source = ReferenceSource::LocalComponent;
};

/**
 * Find the reference for a token key.
 *
 * Returns std::nullopt when no layer supplies a value. Empty values are
 * treated as absent and fall through to the next layer.
 */
[[nodiscard]] std::optional<ResolvedReference> resolve_reference(
  std::string_view token_key, const DocumentId & current_document_id,
  const ComponentMap & local_components, const OverrideSet & overrides);

[[nodiscard]] std::string_view to_string(ReferenceSource source) noexcept;

}  // namespace compdoc
