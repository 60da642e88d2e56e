#pragma once

#include <optional>
#include <string>
#include <vector>

#include "docent_core/types/metadata.hpp"
#include "docent_core/types/source_record.hpp"

namespace docent_core {

// Older prompts asked the model to append its own citation block:
//
//   <answer text>
//   --- SOURCES ---
//   • handbook.pdf
//   • leave_policy.docx
inline constexpr const char *LEGACY_SOURCES_MARKER = "--- SOURCES ---";

// Citation for a retrieved chunk. The filename comes from the "filename"
// metadata, falling back to the last path component of "source". Returns
// nullopt when neither yields a usable name.
std::optional<SourceRecord> source_from_metadata(const Metadata &metadata);

// Answer text with the legacy block, if any, removed and trailing blanks
// trimmed.
std::string strip_legacy_citations(const std::string &answer);

// Filename-only records for each bullet after the legacy marker.
std::vector<SourceRecord> parse_legacy_citations(const std::string &answer);

struct ResolvedAnswer {
  std::string answer;
  std::vector<SourceRecord> sources;
};

// Strips the legacy block and picks the sources: the structured list when it
// is non-empty, otherwise whatever the legacy block names. The legacy block is
// not parsed at all when structured sources exist.
ResolvedAnswer resolve_citations(const std::string &raw_answer,
                                 std::vector<SourceRecord> structured_sources);

}  // namespace docent_core
