// compdoc/model/overrides.hpp - Caller-supplied override layers
#pragma once

#include <initializer_list>
#include <map>
#include <string>
#include <string_view>
#include <utility>

#include "compdoc/model/document.hpp"

namespace compdoc
{

/**
 * Overrides supplied at the top of a resolution call.
 *
 * Two key forms share one map:
 * - namespaced "<documentId>.<tokenKey>": applies only while expanding that document
 * - global "<tokenKey>": applies at every depth
 *
 * The set is passed unchanged through every recursion level.
 */
class OverrideSet
{
public:
  OverrideSet() = default;
  OverrideSet(std::initializer_list<std::pair<const std::string, std::string>> entries)
  : entries_(entries)
  {
  }
  explicit OverrideSet(std::map<std::string, std::string> entries) : entries_(std::move(entries))
  {
  }

  void set(std::string key, std::string reference)
  {
    entries_[std::move(key)] = std::move(reference);
  }

  void set_namespaced(
    std::string_view document_id, std::string_view token_key, std::string reference)
  {
    set(namespaced_key(document_id, token_key), std::move(reference));
  }

  /// Non-empty value stored under the exact key, or nullptr
  [[nodiscard]] const std::string * find(const std::string & key) const;

  [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
  [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
  [[nodiscard]] const std::map<std::string, std::string> & entries() const noexcept
  {
    return entries_;
  }

  /// "<documentId>.<tokenKey>"
  [[nodiscard]] static std::string namespaced_key(
    std::string_view document_id, std::string_view token_key);

private:
  std::map<std::string, std::string> entries_;
};

}  // namespace compdoc
