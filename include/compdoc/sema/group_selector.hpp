// compdoc/sema/group_selector.hpp - Representative selection for groups
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "compdoc/model/document.hpp"

namespace compdoc
{

/**
 * Stable member ordering used for the fallback pick.
 *
 * Members are ordered by the UTC instant of created_at, ties broken by id, so
 * the choice does not depend on the order the store returns them in. Members
 * whose created_at does not parse sort last.
 */
enum class GroupOrder : uint8_t {
  OldestFirst,
  NewestFirst,
};

/**
 * Pick the representative member of a group.
 *
 * Selection order:
 * 1. a member whose document type equals `preferred_type` (when given)
 * 2. the conventional representative, whose id equals `group_id`
 * 3. the first member in `order`
 *
 * Returns std::nullopt only when `members` is empty.
 */
[[nodiscard]] std::optional<DocumentId> select_group_member(
  const GroupId & group_id, const std::optional<std::string> & preferred_type,
  const std::vector<Document> & members, GroupOrder order = GroupOrder::OldestFirst);

/// Sort members into `order` (in place).
void sort_group_members(std::vector<Document> & members, GroupOrder order);

/// Sorted, de-duplicated, non-empty document types of the members.
[[nodiscard]] std::vector<std::string> available_types(const std::vector<Document> & members);

}  // namespace compdoc
