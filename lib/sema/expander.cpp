// compdoc/sema/expander.cpp - Iterative composite document expansion
//
#include "compdoc/sema/expander.hpp"

#include <algorithm>
#include <memory>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <variant>

#include "compdoc/model/reference.hpp"
#include "compdoc/sema/reference_resolver.hpp"
#include "compdoc/syntax/token_scanner.hpp"

namespace compdoc
{

namespace
{

// ============================================================================
// Document arena
// ============================================================================

/// Interns document ids so the active path can be tracked by index.
class DocumentArena
{
public:
  uint32_t intern(const DocumentId & id)
  {
    const auto [it, inserted] = index_.emplace(id, static_cast<uint32_t>(on_path_.size()));
    if (inserted) {
      on_path_.push_back(0);
    }
    return it->second;
  }

  [[nodiscard]] bool on_path(const DocumentId & id) const
  {
    const auto it = index_.find(id);
    return it != index_.end() && on_path_[it->second] != 0;
  }

  void enter(uint32_t index) { ++on_path_[index]; }
  void leave(uint32_t index) { --on_path_[index]; }

private:
  std::unordered_map<DocumentId, uint32_t> index_;
  std::vector<uint32_t> on_path_;
};

// ============================================================================
// Frames
// ============================================================================

/// One document body being rebuilt. Frames are heap-allocated so the token
/// views into `body` stay valid while the stack grows.
struct Frame
{
  DocumentId document_id;
  std::optional<uint32_t> arena_index;  // unset for the caller-supplied root

  std::string body;
  ComponentMap components;
  std::vector<syntax::TokenOccurrence> tokens;

  size_t next_token = 0;
  size_t copied_until = 0;
  std::string out;

  /// Per-body memo: token key -> expansion (nullopt = left as literal text)
  std::unordered_map<std::string, std::optional<std::string>> by_key;

  /// Key of the occurrence waiting for the child frame on top of this one
  std::string pending_key;

  Frame(DocumentId id, std::string text, ComponentMap comps)
  : document_id(std::move(id)), body(std::move(text)), components(std::move(comps))
  {
  }

  void scan() { tokens = syntax::scan_tokens(body); }

  [[nodiscard]] bool done() const noexcept { return next_token >= tokens.size(); }

  /// Substitute the current occurrence and move to the next one.
  void emit(std::string_view replacement)
  {
    const auto & occ = tokens[next_token];
    out.append(body, copied_until, occ.offset - copied_until);
    out.append(replacement);
    copied_until = occ.offset + occ.text.size();
    ++next_token;
  }

  std::string finish()
  {
    out.append(body, copied_until, std::string::npos);
    copied_until = body.size();
    return std::move(out);
  }
};

// ============================================================================
// Walk
// ============================================================================

class ExpansionWalk
{
public:
  ExpansionWalk(
    const DocumentStore & store, const ProjectId & project_id, const ExpanderOptions & options,
    const OverrideSet & overrides, DiagnosticBag * diags)
  : store_(store),
    project_id_(project_id),
    options_(options),
    overrides_(overrides),
    diags_(diags)
  {
  }

  ExpansionResult run(
    const std::string & body, const ComponentMap & local_components,
    const DocumentId & current_document_id, const std::vector<DocumentId> & visited)
  {
    for (const auto & id : visited) {
      arena_.enter(arena_.intern(id));
    }

    auto root = std::make_unique<Frame>(current_document_id, body, local_components);
    root->scan();
    stack_.push_back(std::move(root));

    while (!stack_.empty()) {
      Frame & frame = *stack_.back();

      if (frame.done()) {
        std::string expanded = frame.finish();
        if (frame.arena_index) {
          arena_.leave(*frame.arena_index);
        }
        stack_.pop_back();

        if (stack_.empty()) {
          result_.text = std::move(expanded);
          break;
        }

        Frame & parent = *stack_.back();
        parent.emit(expanded);
        parent.by_key[parent.pending_key] = std::move(expanded);
        continue;
      }

      step(frame);
    }

    return std::move(result_);
  }

  [[nodiscard]] size_t warning_count() const noexcept { return warning_count_; }

private:
  /// Handle the next occurrence of `frame`: substitute it, leave it literal,
  /// or push a child frame for its target.
  void step(Frame & frame)
  {
    const syntax::TokenOccurrence & occ = frame.tokens[frame.next_token];
    std::string key(occ.key);

    const auto memo = frame.by_key.find(key);
    if (memo != frame.by_key.end()) {
      frame.emit(memo->second ? std::string_view(*memo->second) : occ.text);
      return;
    }

    std::optional<Document> target = find_target(frame, occ, key);
    if (!target) {
      frame.by_key.emplace(std::move(key), std::nullopt);
      frame.emit(occ.text);
      return;
    }

    const uint32_t index = arena_.intern(target->id);
    arena_.enter(index);
    ++expansions_;
    if (used_.insert(target->id).second) {
      result_.documents_used.push_back(target->id);
    }

    auto child = std::make_unique<Frame>(
      target->id, std::move(target->content), std::move(target->components));
    child->arena_index = index;
    child->scan();

    frame.pending_key = std::move(key);
    stack_.push_back(std::move(child));
  }

  /// Resolve the occurrence to a fetched document, or std::nullopt if it must
  /// stay literal (a warning has been recorded in that case).
  std::optional<Document> find_target(
    const Frame & frame, const syntax::TokenOccurrence & occ, const std::string & key)
  {
    const auto resolved = resolve_reference(key, frame.document_id, frame.components, overrides_);
    if (!resolved) {
      warn(
        frame, occ, diag_code::k_unresolved_token,
        "no component reference for token '" + key + "'", "token left unresolved");
      return std::nullopt;
    }

    if (!resolved->reference) {
      warn(
        frame, occ, diag_code::k_malformed_reference,
        "malformed component reference '" + resolved->raw + "' for token '" + key + "'",
        "from " + std::string(to_string(resolved->source)));
      return std::nullopt;
    }

    DocumentId target_id;
    if (const auto * group = std::get_if<GroupReference>(&*resolved->reference)) {
      const auto member = select_member(*group);
      if (!member) {
        std::string msg = "group document not found for group '" + group->group + "'";
        if (group->preferred_type) {
          msg += " with type '" + *group->preferred_type + "'";
        }
        warn(frame, occ, diag_code::k_empty_group, msg, "group has no members");
        return std::nullopt;
      }
      target_id = *member;
      if (resolved->source == ReferenceSource::LocalComponent) {
        result_.resolution_cache[frame.document_id][key] = target_id;
      }
    } else {
      target_id = std::get<DirectReference>(*resolved->reference).id;
    }

    if (arena_.on_path(target_id)) {
      warn(
        frame, occ, diag_code::k_circular_reference,
        "circular reference detected for document '" + target_id + "'",
        "already being expanded on this path");
      return std::nullopt;
    }

    // The stack holds the root plus one frame per nesting level.
    if (stack_.size() > options_.limits.max_depth) {
      warn(
        frame, occ, diag_code::k_depth_limit,
        "maximum expansion depth (" + std::to_string(options_.limits.max_depth) +
          ") reached at document '" + target_id + "'",
        "not expanded");
      return std::nullopt;
    }

    if (expansions_ >= options_.limits.max_expansions) {
      warn(
        frame, occ, diag_code::k_expansion_budget,
        "expansion budget (" + std::to_string(options_.limits.max_expansions) +
          " documents) exhausted",
        "not expanded");
      return std::nullopt;
    }

    auto doc = store_.get_document(target_id);
    if (!doc || doc->project_id != project_id_) {
      warn(
        frame, occ, diag_code::k_missing_document,
        "component document '" + target_id + "' not found", "referenced here");
      return std::nullopt;
    }

    return doc;
  }

  std::optional<DocumentId> select_member(const GroupReference & group) const
  {
    std::vector<Document> members = store_.get_group_members(group.group);
    members.erase(
      std::remove_if(
        members.begin(), members.end(),
        [&](const Document & d) { return d.project_id != project_id_; }),
      members.end());
    return select_group_member(group.group, group.preferred_type, members, options_.group_order);
  }

  void warn(
    const Frame & frame, const syntax::TokenOccurrence & occ, const char * code,
    std::string message, std::string label)
  {
    ++warning_count_;
    if (diags_) {
      diags_->report_warning(frame.document_id, occ.range, std::move(message), std::move(label))
        .with_code(code);
    }
  }

  const DocumentStore & store_;
  const ProjectId & project_id_;
  const ExpanderOptions & options_;
  const OverrideSet & overrides_;
  DiagnosticBag * diags_;

  DocumentArena arena_;
  std::vector<std::unique_ptr<Frame>> stack_;
  std::unordered_set<DocumentId> used_;
  ExpansionResult result_;
  size_t expansions_ = 0;
  size_t warning_count_ = 0;
};

}  // namespace

ExpansionResult Expander::expand(
  const std::string & body, const ComponentMap & local_components, const OverrideSet & overrides,
  const DocumentId & current_document_id, const std::vector<DocumentId> & visited)
{
  ExpansionWalk walk(store_, project_id_, options_, overrides, diags_);
  ExpansionResult result = walk.run(body, local_components, current_document_id, visited);
  warning_count_ += walk.warning_count();
  return result;
}

}  // namespace compdoc
