// compdoc/sema/group_selector.cpp - Representative selection for groups
#include "compdoc/sema/group_selector.hpp"

#include <algorithm>
#include <set>
#include <utility>

#include "compdoc/model/timestamp.hpp"

namespace compdoc
{

void sort_group_members(std::vector<Document> & members, GroupOrder order)
{
  struct Keyed
  {
    std::optional<Timestamp> created;
    Document doc;
  };

  std::vector<Keyed> keyed;
  keyed.reserve(members.size());
  for (auto & m : members) {
    auto created = parse_timestamp(m.created_at);
    keyed.push_back({created, std::move(m)});
  }

  // Members without a readable timestamp go last in either order.
  std::stable_sort(keyed.begin(), keyed.end(), [order](const Keyed & a, const Keyed & b) {
    if (a.created.has_value() != b.created.has_value()) {
      return a.created.has_value();
    }
    if (a.created && *a.created != *b.created) {
      return order == GroupOrder::OldestFirst ? *a.created < *b.created
                                              : *a.created > *b.created;
    }
    return a.doc.id < b.doc.id;
  });

  members.clear();
  for (auto & k : keyed) {
    members.push_back(std::move(k.doc));
  }
}

std::optional<DocumentId> select_group_member(
  const GroupId & group_id, const std::optional<std::string> & preferred_type,
  const std::vector<Document> & members, GroupOrder order)
{
  if (members.empty()) {
    return std::nullopt;
  }

  std::vector<Document> ordered = members;
  sort_group_members(ordered, order);

  if (preferred_type) {
    const auto it = std::find_if(ordered.begin(), ordered.end(), [&](const Document & d) {
      return d.document_type && *d.document_type == *preferred_type;
    });
    if (it != ordered.end()) {
      return it->id;
    }
  }

  const auto rep = std::find_if(
    ordered.begin(), ordered.end(), [&](const Document & d) { return d.id == group_id; });
  if (rep != ordered.end()) {
    return rep->id;
  }

  return ordered.front().id;
}

std::vector<std::string> available_types(const std::vector<Document> & members)
{
  std::set<std::string> types;
  for (const auto & m : members) {
    if (m.document_type && !m.document_type->empty()) {
      types.insert(*m.document_type);
    }
  }
  return {types.begin(), types.end()};
}

}  // namespace compdoc
