#pragma once

#include "docent_core/loaders/document_loader.hpp"

namespace docent_core {

class PlainTextLoader : public DocumentLoader {
 public:
  std::vector<std::string> extensions() const override {
    return {".txt"};
  }
  std::string name() const override {
    return "plaintext";
  }
  std::string load(const fs::path &file_path) const override;
};

}  // namespace docent_core
