#pragma once

#include "docent_core/loaders/document_loader.hpp"

namespace docent_core {

// Word documents stored as an OOXML zip container. Legacy .doc files are
// routed here as well and only load when they are in fact OOXML.
class OfficeDocumentLoader : public DocumentLoader {
 public:
  std::vector<std::string> extensions() const override {
    return {".docx", ".doc"};
  }
  std::string name() const override {
    return "office";
  }
  std::string load(const fs::path &file_path) const override;

  // Paragraph text of a word/document.xml part, one paragraph per line.
  static std::string text_from_document_xml(const std::string &xml);

 private:
  static std::string read_zip_entry(const fs::path &file_path, const std::string &entry_name);
};

}  // namespace docent_core
