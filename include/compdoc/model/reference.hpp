// compdoc/model/reference.hpp - Component references (direct or group)
//
// Reference strings are parsed exactly once, at the boundary, into a tagged
// union. The textual forms are stored in existing documents and must be
// preserved byte-for-byte:
//
//   <documentId>                      direct reference
//   group:<groupId>                   group reference
//   group:<groupId>:<preferredType>   group reference with a preferred type
//
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "compdoc/model/document.hpp"

namespace compdoc
{

struct DirectReference
{
  DocumentId id;

  [[nodiscard]] bool operator==(const DirectReference & other) const { return id == other.id; }
};

struct GroupReference
{
  GroupId group;
  std::optional<std::string> preferred_type;

  [[nodiscard]] bool operator==(const GroupReference & other) const
  {
    return group == other.group && preferred_type == other.preferred_type;
  }
};

using Reference = std::variant<DirectReference, GroupReference>;

inline constexpr std::string_view k_group_reference_prefix = "group:";

/**
 * Parse a stored reference string.
 *
 * Returns std::nullopt for values that are not references at all: the empty
 * string and "group:" without a group id.
 */
[[nodiscard]] std::optional<Reference> parse_reference(std::string_view text);

/// Inverse of parse_reference for well-formed references.
[[nodiscard]] std::string format_reference(const Reference & ref);

[[nodiscard]] inline bool is_group_reference(const Reference & ref) noexcept
{
  return std::holds_alternative<GroupReference>(ref);
}

}  // namespace compdoc
