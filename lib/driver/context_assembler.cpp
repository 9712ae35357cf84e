// compdoc/driver/context_assembler.cpp - Prompt context assembly implementation
//
#include "compdoc/driver/context_assembler.hpp"

#include <algorithm>
#include <optional>
#include <unordered_set>
#include <variant>

#include "compdoc/model/reference.hpp"
#include "compdoc/sema/group_selector.hpp"

namespace compdoc
{

namespace
{

std::string format_section(
  const Document & doc, const std::string & content, std::string_view context_type)
{
  std::string out = "=== ";
  out.append(context_type);
  out += ": " + doc.title + " ===\n";
  if (doc.document_type) {
    out += "Type: " + *doc.document_type + "\n";
  }
  out += "Content:\n" + content;
  return out;
}

bool contains_value(const std::vector<std::string> & values, const std::string & value)
{
  return std::find(values.begin(), values.end(), value) != values.end();
}

}  // namespace

AssembledContext ContextAssembler::assemble(
  const ProjectId & project_id, const DocumentId & primary_id,
  const std::vector<DocumentId> & additional_ids, const ContextOptions & options) const
{
  AssembledContext result;

  const auto primary = catalog_.get_document(primary_id);
  if (!primary || primary->project_id != project_id) {
    result.diagnostics
      .report_error({}, {}, "primary document '" + primary_id + "' not found")
      .with_code(diag_code::k_unknown_document);
    return result;
  }

  const std::string primary_section =
    format_section(*primary, resolve_content(*primary, result.diagnostics), "Primary Document");
  result.context = primary_section;
  result.token_count = estimate_tokens(primary_section);
  result.documents_used.push_back(primary->id);

  const auto try_append = [&](const Document & doc, std::string_view context_type) {
    const std::string section =
      format_section(doc, resolve_content(doc, result.diagnostics), context_type);
    const size_t tokens = estimate_tokens(section);
    if (result.token_count + tokens > options.max_tokens) {
      return;
    }
    result.context += "\n\n" + section;
    result.token_count += tokens;
    result.documents_used.push_back(doc.id);
  };

  for (const auto & id : additional_ids) {
    if (result.token_count >= options.max_tokens) {
      break;
    }
    const auto doc = catalog_.get_document(id);
    if (!doc || doc->project_id != project_id) {
      continue;
    }
    try_append(*doc, "Additional Context");
  }

  if (options.include_related && result.token_count < options.max_tokens) {
    for (const auto & doc : find_related(project_id, *primary, result.documents_used, options)) {
      if (result.token_count >= options.max_tokens) {
        break;
      }
      try_append(doc, "Related Context");
    }
  }

  result.success = true;
  return result;
}

std::vector<Document> ContextAssembler::find_related(
  const ProjectId & project_id, const Document & primary, const std::vector<DocumentId> & exclude,
  const ContextOptions & options) const
{
  std::vector<Document> related;
  std::unordered_set<DocumentId> seen(exclude.begin(), exclude.end());

  const auto take = [&](Document doc) {
    if (doc.project_id != project_id || !seen.insert(doc.id).second) {
      return;
    }
    related.push_back(std::move(doc));
  };

  // 1. Same group
  if (primary.group_id) {
    std::vector<Document> members = catalog_.get_group_members(*primary.group_id);
    sort_group_members(members, engine_.options().expander.group_order);
    for (auto & doc : members) {
      take(std::move(doc));
    }
  }

  // 2. Preferred types
  if (!options.preferred_types.empty()) {
    for (auto & doc : catalog_.documents_in_project(project_id)) {
      if (doc.document_type && contains_value(options.preferred_types, *doc.document_type)) {
        take(std::move(doc));
      }
    }
  }

  // 3. Direct references from the primary's component map
  for (const auto & [key, value] : primary.components) {
    const auto ref = parse_reference(value);
    if (!ref || !std::holds_alternative<DirectReference>(*ref)) {
      continue;
    }
    if (auto doc = catalog_.get_document(std::get<DirectReference>(*ref).id)) {
      take(std::move(*doc));
    }
  }

  const auto rank = [&](const Document & doc) {
    if (primary.group_id && doc.group_id == primary.group_id) {
      return 0;
    }
    if (doc.document_type && contains_value(options.preferred_types, *doc.document_type)) {
      return 1;
    }
    return 2;
  };
  std::stable_sort(related.begin(), related.end(), [&](const Document & a, const Document & b) {
    return rank(a) < rank(b);
  });

  if (related.size() > options.related_limit) {
    related.resize(options.related_limit);
  }
  return related;
}

std::string ContextAssembler::resolve_content(const Document & doc, DiagnosticBag & diags) const
{
  if (!doc.is_composite()) {
    return doc.content;
  }
  ResolveResult resolved = engine_.resolve(doc.id);
  diags.merge(std::move(resolved.diagnostics));
  return resolved.success ? std::move(resolved.text) : doc.content;
}

}  // namespace compdoc
