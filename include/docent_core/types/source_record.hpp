#pragma once

#include <optional>
#include <string>

namespace docent_core {

// One citation surfaced by a retrieval call. Two records with the same
// (filename, document_type, department, source) are the same citation.
struct SourceRecord {
  std::string filename;
  std::optional<std::string> document_type;
  std::optional<std::string> department;
  std::optional<std::string> source;

  bool operator==(const SourceRecord &other) const = default;
};

}  // namespace docent_core
