#include "docent_core/agent/tools/document_search_tool.hpp"

#include <utility>
#include <vector>

#include "docent_core/provenance/citations.hpp"

namespace docent_core {

std::string preview_text(const std::string &text, size_t max_bytes) {
  if (text.size() <= max_bytes) {
    return text;
  }
  size_t cut = max_bytes;
  while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
    --cut;
  }
  return text.substr(0, cut) + "...";
}

DocumentSearchTool::DocumentSearchTool(std::shared_ptr<RetrievalService> retrieval,
                                       DocumentSearchOptions options)
    : retrieval_(std::move(retrieval)), options_(options) {}

ToolSpec DocumentSearchTool::spec() const {
  return ToolSpec{
      .name = NAME,
      .description = "Search through official documents, policies, and procedures. Use this "
                     "for general information queries.",
      .parameters = {{"type", "object"},
                     {"properties",
                      {{"query", {{"type", "string"}, {"description", "What to look for"}}},
                       {"document_type",
                        {{"type", "string"}, {"description", "Optional document type, e.g. policy"}}},
                       {"department",
                        {{"type", "string"}, {"description", "Optional owning department"}}}}},
                     {"required", nlohmann::json::array({"query"})}}};
}

ToolResult DocumentSearchTool::invoke(const nlohmann::json &arguments, const ToolContext &context) {
  const auto query = string_argument(arguments, "query");
  if (!query) {
    return ToolResult::failure_response(ToolErrorKind::InvalidArguments,
                                        "search_documents needs a non-empty 'query' argument.");
  }

  MetadataFilter filter{{metadata_keys::TYPE, OFFICIAL_DOCUMENT}};
  if (auto document_type = string_argument(arguments, "document_type")) {
    filter[metadata_keys::DOCUMENT_TYPE] = *document_type;
  }
  if (auto department = string_argument(arguments, "department")) {
    filter[metadata_keys::DEPARTMENT] = *department;
  }

  const std::vector<RetrievalHit> hits = retrieval_->search(*query, options_.k, filter);
  if (hits.empty()) {
    return ToolResult::success_response("No relevant documents found for your query.");
  }

  std::vector<SourceRecord> sources;
  std::string output = "Relevant documents found:\n";
  for (size_t i = 0; i < hits.size(); ++i) {
    const auto &chunk = hits[i].chunk;
    const auto source = source_from_metadata(chunk.metadata);
    if (source) {
      sources.push_back(*source);
    }

    if (i > 0) {
      output += "\n\n";
    }
    output += std::to_string(i + 1) + ". " + preview_text(chunk.content, options_.preview_chars);
    output += " [Source: " + (source ? source->filename : std::string("Unknown")) + "]";
  }

  if (context.scope) {
    context.scope->record(sources);
  }
  return ToolResult::success_response(output);
}

}  // namespace docent_core
