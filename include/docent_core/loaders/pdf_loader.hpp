#pragma once

#include "docent_core/loaders/document_loader.hpp"

namespace docent_core {

// Extracts the text-showing operators of every page with qpdf. Pages are
// separated by a blank line so the chunker sees them as paragraphs.
class PdfLoader : public DocumentLoader {
 public:
  std::vector<std::string> extensions() const override {
    return {".pdf"};
  }
  std::string name() const override {
    return "pdf";
  }
  std::string load(const fs::path &file_path) const override;

  // Collapses runs of blanks and newlines left behind by text operators
  static std::string clean_text(const std::string &raw_text);
};

}  // namespace docent_core
