// compdoc/model/overrides.cpp - Override lookup
#include "compdoc/model/overrides.hpp"

namespace compdoc
{

const std::string * OverrideSet::find(const std::string & key) const
{
  const auto it = entries_.find(key);
  // Stored data treats an empty value as "no override".
  if (it == entries_.end() || it->second.empty()) {
    return nullptr;
  }
  return &it->second;
}

std::string OverrideSet::namespaced_key(std::string_view document_id, std::string_view token_key)
{
  std::string key;
  key.reserve(document_id.size() + 1 + token_key.size());
  key.append(document_id);
  key.push_back('.');
  key.append(token_key);
  return key;
}

}  // namespace compdoc
