// compdoc/driver/report_writer.cpp - JSON serialization implementation
//
#include "compdoc/driver/report_writer.hpp"

#include <string>
#include <variant>

#include "compdoc/model/reference.hpp"
#include "compdoc/store/json_store.hpp"

namespace compdoc
{
namespace
{

using nlohmann::json;

json j_range(SourceRange r)
{
  if (r.is_invalid()) {
    return json{{"start", nullptr}, {"end", nullptr}};
  }
  return json{{"start", r.get_begin().get_offset()}, {"end", r.get_end().get_offset()}};
}

json j_label(const Label & label)
{
  return json{
    {"document", label.document_id},
    {"range", j_range(label.range)},
    {"message", label.message},
    {"primary", label.style == LabelStyle::Primary}};
}

json j_reference(const Reference & ref)
{
  if (const auto * group = std::get_if<GroupReference>(&ref)) {
    json j{{"kind", "group"}, {"group", group->group}};
    j["preferred_type"] = group->preferred_type ? json(*group->preferred_type) : json(nullptr);
    return j;
  }
  return json{{"kind", "document"}, {"id", std::get<DirectReference>(ref).id}};
}

json j_cycle_error(const CycleError & error)
{
  json j{
    {"document", error.document_id},
    {"component", error.component_key},
    {"reference", j_reference(error.reference)},
    {"path", error.path},
    {"message", error.message()}};
  j["member"] = error.member ? json(*error.member) : json(nullptr);
  return j;
}

}  // namespace

json to_json(const Diagnostic & diag)
{
  json labels = json::array();
  for (const auto & label : diag.labels) {
    labels.push_back(j_label(label));
  }

  json j{
    {"severity", std::string(to_string(diag.severity))},
    {"code", diag.code},
    {"message", diag.message},
    {"labels", std::move(labels)}};
  j["help"] = diag.help_message ? json(*diag.help_message) : json(nullptr);
  return j;
}

json to_json(const DiagnosticBag & diags)
{
  json out = json::array();
  for (const auto & d : diags) {
    out.push_back(to_json(d));
  }
  return out;
}

json to_json(const ResolveResult & result)
{
  json cache = json::object();
  for (const auto & [document_id, choices] : result.resolution_cache) {
    cache[document_id] = choices;
  }

  return json{
    {"success", result.success},
    {"text", result.text},
    {"documents_used", result.documents_used},
    {"resolution_cache", std::move(cache)},
    {"diagnostics", to_json(result.diagnostics)}};
}

json to_json(const ValidationResult & result, const DiagnosticBag & diags)
{
  json j{{"ok", result.ok()}, {"diagnostics", to_json(diags)}};
  j["error"] = result.error ? j_cycle_error(*result.error) : json(nullptr);
  return j;
}

json to_json(const GroupResolution & result)
{
  json j{
    {"success", result.success},
    {"resolved_content", result.resolved_content},
    {"available_types", result.available_types},
    {"diagnostics", to_json(result.diagnostics)}};
  j["selected"] = result.selected ? to_json(*result.selected) : json(nullptr);
  return j;
}

json to_json(const AssembledContext & result)
{
  return json{
    {"success", result.success},
    {"context", result.context},
    {"documents_used", result.documents_used},
    {"token_count", result.token_count},
    {"diagnostics", to_json(result.diagnostics)}};
}

}  // namespace compdoc
