// compdoc/sema/cycle_validator.cpp - Iterative DFS cycle detection
//
#include "compdoc/sema/cycle_validator.hpp"

#include <algorithm>
#include <gsl/span>
#include <unordered_map>
#include <utility>
#include <variant>

namespace compdoc
{

namespace
{

enum class Color : uint8_t { White, Gray, Black };

struct DfsFrame
{
  DocumentId id;
  std::vector<DocumentId> successors;
  size_t next = 0;
};

/// Build the cycle path from the DFS stack: everything from `from` to the
/// top of the stack, closed by `closing`.
std::vector<DocumentId> cycle_path(
  gsl::span<const DfsFrame> stack, const DocumentId & from, const DocumentId & closing)
{
  size_t start = 0;
  for (; start < stack.size(); ++start) {
    if (stack[start].id == from) {
      break;
    }
  }

  std::vector<DocumentId> path;
  if (start >= stack.size()) {
    // `from` is not on the stack: the path starts outside the walk (the
    // edited document itself).
    path.push_back(from);
    start = 0;
  }
  for (size_t i = start; i < stack.size(); ++i) {
    path.push_back(stack[i].id);
  }
  path.push_back(closing);
  return path;
}

class CycleSearch
{
public:
  CycleSearch(const DocumentStore & store, const DocumentId & target, const ProjectId & project_id)
  : store_(store), target_(target), project_id_(project_id)
  {
  }

  /// Members of a group that belong to the project, ordered by id.
  std::vector<DocumentId> group_members(const GroupId & group)
  {
    std::vector<DocumentId> ids;
    for (const auto & doc : store_.get_group_members(group)) {
      if (doc.project_id == project_id_) {
        ids.push_back(doc.id);
      }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
  }

  /**
   * Search for a path from `start` back to the target, or into any cycle.
   *
   * @return the cycle path, or std::nullopt when no cycle is reachable
   */
  std::optional<std::vector<DocumentId>> find_cycle_from(const DocumentId & start)
  {
    if (start == target_) {
      return std::vector<DocumentId>{target_, start};
    }

    const Color c = color_of(start);
    if (c == Color::Black) {
      return std::nullopt;
    }

    std::vector<DfsFrame> stack;
    push(stack, start);

    while (!stack.empty()) {
      DfsFrame & top = stack.back();
      if (top.next >= top.successors.size()) {
        color_[top.id] = Color::Black;
        stack.pop_back();
        continue;
      }

      const DocumentId next = top.successors[top.next++];
      const gsl::span<const DfsFrame> view(stack.data(), stack.size());

      if (next == target_) {
        return cycle_path(view, target_, next);
      }

      switch (color_of(next)) {
        case Color::Gray:
          return cycle_path(view, next, next);
        case Color::Black:
          break;
        case Color::White:
          push(stack, next);
          break;
      }
    }

    return std::nullopt;
  }

  [[nodiscard]] size_t fetch_count() const noexcept { return fetch_count_; }

private:
  Color color_of(const DocumentId & id) const
  {
    const auto it = color_.find(id);
    return it == color_.end() ? Color::White : it->second;
  }

  void push(std::vector<DfsFrame> & stack, const DocumentId & id)
  {
    color_[id] = Color::Gray;
    DfsFrame frame;
    frame.id = id;
    frame.successors = successors_of(id);
    stack.push_back(std::move(frame));
  }

  /// Every document a stored document references, with groups expanded.
  std::vector<DocumentId> successors_of(const DocumentId & id)
  {
    ++fetch_count_;
    const auto doc = store_.get_document(id);
    if (!doc || doc->project_id != project_id_) {
      return {};
    }

    std::vector<DocumentId> out;
    for (const auto & [key, value] : doc->components) {
      const auto ref = parse_reference(value);
      if (!ref) {
        continue;
      }
      if (const auto * group = std::get_if<GroupReference>(&*ref)) {
        auto members = group_members(group->group);
        out.insert(out.end(), members.begin(), members.end());
      } else {
        out.push_back(std::get<DirectReference>(*ref).id);
      }
    }
    return out;
  }

  const DocumentStore & store_;
  const DocumentId & target_;
  const ProjectId & project_id_;
  std::unordered_map<DocumentId, Color> color_;
  size_t fetch_count_ = 0;
};

}  // namespace

// ============================================================================
// CycleError
// ============================================================================

std::string CycleError::message() const
{
  if (const auto * group = std::get_if<GroupReference>(&reference)) {
    return "Cyclic dependency detected: Group " + group->group + " contains document " +
           member.value_or("<unknown>") + " that would create a circular reference";
  }
  return "Cyclic dependency detected: Document " + std::get<DirectReference>(reference).id +
         " would create a circular reference";
}

std::string CycleError::path_string() const
{
  std::string out;
  for (size_t i = 0; i < path.size(); ++i) {
    if (i > 0) out += " -> ";
    out += path[i];
  }
  return out;
}

// ============================================================================
// CycleValidator
// ============================================================================

ValidationResult CycleValidator::validate(
  const DocumentId & document_id, const ComponentMap & proposed_components,
  const ProjectId & project_id)
{
  has_errors_ = false;
  error_count_ = 0;
  fetch_count_ = 0;

  // Colours are shared across all proposed references: a document fully
  // explored for one reference cannot lead back for another.
  CycleSearch search(store_, document_id, project_id);
  std::optional<CycleError> failure;

  for (const auto & [key, value] : proposed_components) {
    const auto ref = parse_reference(value);
    if (!ref) {
      if (diags_) {
        diags_->report_warning(document_id, {}, "malformed component reference '" + value + "'")
          .with_code(diag_code::k_malformed_reference)
          .with_help("component '" + key + "' is ignored by the cycle check");
      }
      continue;
    }

    if (const auto * group = std::get_if<GroupReference>(&*ref)) {
      for (const auto & member : search.group_members(group->group)) {
        if (auto path = search.find_cycle_from(member)) {
          failure = CycleError{document_id, key, *ref, member, std::move(*path)};
          break;
        }
      }
    } else if (auto path = search.find_cycle_from(std::get<DirectReference>(*ref).id)) {
      failure = CycleError{document_id, key, *ref, std::nullopt, std::move(*path)};
    }

    if (failure) {
      break;
    }
  }

  fetch_count_ = search.fetch_count();

  if (!failure) {
    return ValidationResult::success();
  }

  has_errors_ = true;
  ++error_count_;
  if (diags_) {
    diags_
      ->report_error(
        document_id, {}, failure->message(), "component '" + failure->component_key + "'")
      .with_code(diag_code::k_cyclic_dependency)
      .with_help("cycle: " + failure->path_string());
  }
  return ValidationResult::fail(std::move(*failure));
}

}  // namespace compdoc
