#pragma once

#include <memory>

#include "docent_core/agent/tool.hpp"
#include "docent_core/services/retrieval_service.hpp"

namespace docent_core {

struct DocumentSearchOptions {
  int k = 3;
  size_t preview_chars = 300;
};

// "search_documents": official documents, optionally narrowed by
// document_type and department. Every hit with a usable filename is recorded
// as a source of the current request.
class DocumentSearchTool : public Tool {
 public:
  static constexpr const char *NAME = "search_documents";

  DocumentSearchTool(std::shared_ptr<RetrievalService> retrieval, DocumentSearchOptions options = {});

  std::string name() const override {
    return NAME;
  }
  ToolSpec spec() const override;
  ToolResult invoke(const nlohmann::json &arguments, const ToolContext &context) override;

 private:
  std::shared_ptr<RetrievalService> retrieval_;
  DocumentSearchOptions options_;
};

// Cuts text to at most max_bytes on a code point boundary and appends "..."
// when something was cut.
std::string preview_text(const std::string &text, size_t max_bytes);

}  // namespace docent_core
