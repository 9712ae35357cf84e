// compdoc/model/reference.cpp - Reference parsing
#include "compdoc/model/reference.hpp"

namespace compdoc
{

std::optional<Reference> parse_reference(std::string_view text)
{
  if (text.empty()) {
    return std::nullopt;
  }

  if (text.substr(0, k_group_reference_prefix.size()) != k_group_reference_prefix) {
    return DirectReference{std::string(text)};
  }

  // Fields are ':'-separated; anything after the preferred type is ignored.
  std::string_view rest = text.substr(k_group_reference_prefix.size());
  const auto group_end = rest.find(':');
  const std::string_view group = rest.substr(0, group_end);
  if (group.empty()) {
    return std::nullopt;
  }

  GroupReference ref;
  ref.group = std::string(group);

  if (group_end != std::string_view::npos) {
    rest = rest.substr(group_end + 1);
    const std::string_view type = rest.substr(0, rest.find(':'));
    if (!type.empty()) {
      ref.preferred_type = std::string(type);
    }
  }

  return ref;
}

std::string format_reference(const Reference & ref)
{
  if (const auto * direct = std::get_if<DirectReference>(&ref)) {
    return direct->id;
  }

  const auto & group = std::get<GroupReference>(ref);
  std::string out(k_group_reference_prefix);
  out += group.group;
  if (group.preferred_type) {
    out += ':';
    out += *group.preferred_type;
  }
  return out;
}

}  // namespace compdoc
