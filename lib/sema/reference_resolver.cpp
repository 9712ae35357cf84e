// compdoc/sema/reference_resolver.cpp - Override precedence
#include "compdoc/sema/reference_resolver.hpp"

namespace compdoc
{

namespace
{

ResolvedReference make_resolved(const std::string & raw, ReferenceSource source)
{
  ResolvedReference r;
  r.raw = raw;
  r.reference = parse_reference(raw);
  r.source = source;
  return r;
}

}  // namespace

std::optional<ResolvedReference> resolve_reference(
  std::string_view token_key, const DocumentId & current_document_id,
  const ComponentMap & local_components, const OverrideSet & overrides)
{
  const std::string key(token_key);

  if (const std::string * v =
        overrides.find(OverrideSet::namespaced_key(current_document_id, token_key))) {
    return make_resolved(*v, ReferenceSource::NamespacedOverride);
  }

  if (const std::string * v = overrides.find(key)) {
    return make_resolved(*v, ReferenceSource::GlobalOverride);
  }

  const auto it = local_components.find(key);
  if (it != local_components.end() && !it->second.empty()) {
    return make_resolved(it->second, ReferenceSource::LocalComponent);
  }

  return std::nullopt;
}

std::string_view to_string(ReferenceSource source) noexcept
{
  switch (source) {
    case ReferenceSource::NamespacedOverride:
      return "namespaced override";
    case ReferenceSource::GlobalOverride:
      return "global override";
    case ReferenceSource::LocalComponent:
      return "component map";
  }
  return "component map";
}

}  // namespace compdoc
