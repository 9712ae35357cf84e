// compdoc/store/json_store.cpp - JSON document snapshots
//
#include "compdoc/store/json_store.hpp"

#include <fstream>
#include <sstream>
#include <unordered_set>

#include "compdoc/model/timestamp.hpp"

namespace compdoc
{

namespace
{

using nlohmann::json;

bool read_string(const json & j, const char * field, std::string & out, std::string & error)
{
  const auto it = j.find(field);
  if (it == j.end() || it->is_null()) {
    return true;
  }
  if (!it->is_string()) {
    error = std::string("field '") + field + "' must be a string";
    return false;
  }
  out = it->get<std::string>();
  return true;
}

bool read_optional_string(
  const json & j, const char * field, std::optional<std::string> & out, std::string & error)
{
  std::string value;
  if (!read_string(j, field, value, error)) {
    return false;
  }
  // Empty strings are stored for "no group"/"no type" by older exports.
  if (!value.empty()) {
    out = std::move(value);
  }
  return true;
}

StoreLoadResult load_from_json(const json & root)
{
  if (!root.is_object() || !root.contains("documents")) {
    return StoreLoadResult::fail("snapshot must be an object with a 'documents' array");
  }
  const json & docs = root.at("documents");
  if (!docs.is_array()) {
    return StoreLoadResult::fail("'documents' must be an array");
  }

  auto store = std::make_unique<InMemoryDocumentStore>();
  std::unordered_set<std::string> seen;

  size_t index = 0;
  for (const auto & entry : docs) {
    std::string error;
    auto doc = document_from_json(entry, error);
    if (!doc) {
      return StoreLoadResult::fail(
        "invalid document at index " + std::to_string(index) + ": " + error);
    }
    if (!seen.insert(doc->id).second) {
      return StoreLoadResult::fail("duplicate document id: '" + doc->id + "'");
    }
    store->put(std::move(*doc));
    ++index;
  }

  return StoreLoadResult::ok(std::move(store));
}

}  // namespace

std::optional<Document> document_from_json(const json & j, std::string & error)
{
  if (!j.is_object()) {
    error = "document entry must be an object";
    return std::nullopt;
  }

  Document doc;
  if (
    !read_string(j, "id", doc.id, error) || !read_string(j, "project_id", doc.project_id, error) ||
    !read_string(j, "title", doc.title, error) || !read_string(j, "content", doc.content, error) ||
    !read_string(j, "created_at", doc.created_at, error) ||
    !read_optional_string(j, "group_id", doc.group_id, error) ||
    !read_optional_string(j, "document_type", doc.document_type, error)) {
    return std::nullopt;
  }

  if (doc.id.empty()) {
    error = "document must have a non-empty 'id'";
    return std::nullopt;
  }

  if (!doc.created_at.empty() && !parse_timestamp(doc.created_at)) {
    error = "'created_at' is not an ISO-8601 timestamp: '" + doc.created_at + "'";
    return std::nullopt;
  }

  const auto comps = j.find("components");
  if (comps != j.end() && !comps->is_null()) {
    if (!comps->is_object()) {
      error = "'components' must be an object";
      return std::nullopt;
    }
    for (const auto & [key, value] : comps->items()) {
      if (!value.is_string()) {
        error = "component '" + key + "' must map to a string reference";
        return std::nullopt;
      }
      doc.components.emplace(key, value.get<std::string>());
    }
  }

  return doc;
}

json to_json(const Document & doc)
{
  json j{
    {"id", doc.id},
    {"project_id", doc.project_id},
    {"title", doc.title},
    {"content", doc.content},
    {"components", doc.components},
    {"created_at", doc.created_at}};
  j["group_id"] = doc.group_id ? json(*doc.group_id) : json(nullptr);
  j["document_type"] = doc.document_type ? json(*doc.document_type) : json(nullptr);
  return j;
}

StoreLoadResult load_document_store(const std::filesystem::path & path)
{
  std::ifstream file(path);
  if (!file.is_open()) {
    return StoreLoadResult::fail("cannot open document snapshot: " + path.string());
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_document_store_from_string(buffer.str());
}

StoreLoadResult load_document_store_from_string(std::string_view text)
{
  json root;
  try {
    root = json::parse(text.begin(), text.end());
  } catch (const json::parse_error & e) {
    return StoreLoadResult::fail("failed to parse JSON: " + std::string(e.what()));
  }
  return load_from_json(root);
}

}  // namespace compdoc
