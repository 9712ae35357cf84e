// compdoc/driver/engine.cpp - Resolution engine facade implementation
//
#include "compdoc/driver/engine.hpp"

#include <algorithm>

#include "compdoc/project/project_config.hpp"
#include "compdoc/sema/group_selector.hpp"
#include "compdoc/store/in_memory_store.hpp"

namespace compdoc
{

EngineOptions EngineOptions::from_config(const ProjectConfig & config)
{
  EngineOptions options;
  options.expander.limits = config.resolver.limits;
  options.expander.group_order = config.resolver.group_order;
  return options;
}

ResolveResult Engine::resolve(const DocumentId & document_id, const OverrideSet & overrides) const
{
  ResolveResult result;

  const auto doc = store_.get_document(document_id);
  if (!doc) {
    result.diagnostics
      .report_error({}, {}, "document '" + document_id + "' not found")
      .with_code(diag_code::k_unknown_document);
    return result;
  }

  Expander expander(store_, doc->project_id, options_.expander, &result.diagnostics);
  ExpansionResult expanded =
    expander.expand(doc->content, doc->components, overrides, doc->id, {doc->id});

  result.success = true;
  result.text = std::move(expanded.text);
  result.resolution_cache = std::move(expanded.resolution_cache);
  result.documents_used = std::move(expanded.documents_used);
  return result;
}

ValidationResult Engine::validate(
  const DocumentId & document_id, const ComponentMap & proposed_components,
  const ProjectId & project_id, DiagnosticBag * diags) const
{
  CycleValidator validator(store_, diags);
  return validator.validate(document_id, proposed_components, project_id);
}

GroupResolution Engine::resolve_group(
  const ProjectId & project_id, const GroupId & group_id,
  const std::optional<std::string> & preferred_type) const
{
  GroupResolution result;

  std::vector<Document> members = store_.get_group_members(group_id);
  members.erase(
    std::remove_if(
      members.begin(), members.end(),
      [&](const Document & d) { return d.project_id != project_id; }),
    members.end());

  result.available_types = available_types(members);

  const auto selected_id =
    select_group_member(group_id, preferred_type, members, options_.expander.group_order);
  if (!selected_id) {
    result.diagnostics
      .report_warning({}, {}, "group document not found for group '" + group_id + "'")
      .with_code(diag_code::k_empty_group);
    return result;
  }

  const auto it = std::find_if(
    members.begin(), members.end(), [&](const Document & d) { return d.id == *selected_id; });
  Document selected = *it;

  if (selected.is_composite()) {
    Expander expander(store_, project_id, options_.expander, &result.diagnostics);
    result.resolved_content =
      expander.expand(selected.content, selected.components, {}, selected.id, {selected.id}).text;
  } else {
    result.resolved_content = selected.content;
  }

  result.selected = std::move(selected);
  result.success = true;
  return result;
}

size_t apply_resolution_cache(InMemoryDocumentStore & store, const ResolutionCache & cache)
{
  size_t written = 0;
  for (const auto & [document_id, choices] : cache) {
    auto doc = store.get_document(document_id);
    if (!doc) {
      continue;
    }
    for (const auto & [key, member_id] : choices) {
      doc->components[key] = member_id;
      ++written;
    }
    store.set_components(document_id, std::move(doc->components));
  }
  return written;
}

}  // namespace compdoc
