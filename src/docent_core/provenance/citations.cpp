#include "docent_core/provenance/citations.hpp"

#include <filesystem>
#include <sstream>
#include <utility>

#include "docent_core/provenance/query_scope.hpp"

namespace docent_core {

namespace {

const std::string BULLET = "\xE2\x80\xA2";  // U+2022

std::string trim(const std::string &text) {
  const size_t start = text.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return "";
  }
  const size_t end = text.find_last_not_of(" \t\r\n");
  return text.substr(start, end - start + 1);
}

}  // namespace

std::optional<SourceRecord> source_from_metadata(const Metadata &metadata) {
  SourceRecord record;
  record.document_type = metadata_string(metadata, metadata_keys::DOCUMENT_TYPE);
  record.department = metadata_string(metadata, metadata_keys::DEPARTMENT);
  record.source = metadata_string(metadata, metadata_keys::SOURCE);

  if (auto filename = metadata_string(metadata, metadata_keys::FILENAME)) {
    record.filename = *filename;
  } else if (record.source) {
    record.filename = std::filesystem::path(*record.source).filename().string();
  }

  if (!QueryScope::is_usable(record)) {
    return std::nullopt;
  }
  return record;
}

std::string strip_legacy_citations(const std::string &answer) {
  const size_t marker = answer.find(LEGACY_SOURCES_MARKER);
  if (marker == std::string::npos) {
    return trim(answer);
  }
  return trim(answer.substr(0, marker));
}

std::vector<SourceRecord> parse_legacy_citations(const std::string &answer) {
  const size_t marker = answer.find(LEGACY_SOURCES_MARKER);
  if (marker == std::string::npos) {
    return {};
  }

  QueryScope seen;
  std::istringstream block(answer.substr(marker + std::string(LEGACY_SOURCES_MARKER).size()));
  std::string line;
  while (std::getline(block, line)) {
    line = trim(line);
    if (line.rfind(BULLET, 0) != 0) {
      continue;
    }
    SourceRecord record;
    record.filename = trim(line.substr(BULLET.size()));
    seen.record(record);
  }
  return seen.drain();
}

ResolvedAnswer resolve_citations(const std::string &raw_answer,
                                 std::vector<SourceRecord> structured_sources) {
  ResolvedAnswer resolved;
  resolved.answer = strip_legacy_citations(raw_answer);
  if (!structured_sources.empty()) {
    resolved.sources = std::move(structured_sources);
  } else {
    resolved.sources = parse_legacy_citations(raw_answer);
  }
  return resolved;
}

}  // namespace docent_core
