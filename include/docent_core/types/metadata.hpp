#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace docent_core {

// Chunk metadata: a JSON object of scalar or string-list values.
using Metadata = nlohmann::json;

// Conjunction of exact-match constraints over metadata keys. An absent key
// imposes no constraint.
using MetadataFilter = std::map<std::string, std::string>;

namespace metadata_keys {
inline constexpr const char *TYPE = "type";
inline constexpr const char *DOCUMENT_TYPE = "document_type";
inline constexpr const char *DEPARTMENT = "department";
inline constexpr const char *SOURCE = "source";
inline constexpr const char *FILENAME = "filename";
inline constexpr const char *USER_ID = "user_id";
inline constexpr const char *TIMESTAMP = "timestamp";
}  // namespace metadata_keys

inline constexpr const char *OFFICIAL_DOCUMENT = "official_document";
inline constexpr const char *CHAT_HISTORY = "chat_history";

// Returns the value under `key` when it is a non-empty string.
inline std::optional<std::string> metadata_string(const Metadata &metadata,
                                                  const std::string &key) {
  if (!metadata.is_object()) {
    return std::nullopt;
  }
  auto it = metadata.find(key);
  if (it == metadata.end() || !it->is_string()) {
    return std::nullopt;
  }
  std::string value = it->get<std::string>();
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

}  // namespace docent_core
