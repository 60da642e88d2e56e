#include "docent_core/loaders/loader_registry.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "docent_core/loaders/office_document_loader.hpp"
#include "docent_core/loaders/pdf_loader.hpp"
#include "docent_core/loaders/plaintext_loader.hpp"

namespace docent_core {

std::shared_ptr<LoaderRegistry> LoaderRegistry::create_default() {
  auto registry = std::make_shared<LoaderRegistry>();
  registry->register_loader(std::make_shared<PlainTextLoader>());
  registry->register_loader(std::make_shared<PdfLoader>());
  registry->register_loader(std::make_shared<OfficeDocumentLoader>());
  return registry;
}

void LoaderRegistry::register_loader(DocumentLoaderPtr loader) {
  if (!loader) {
    throw std::invalid_argument("Cannot register a null loader");
  }
  for (const auto &extension : loader->extensions()) {
    loaders_by_extension_[extension] = loader;
  }
}

std::string LoaderRegistry::normalized_extension(const std::filesystem::path &file_path) {
  std::string extension = file_path.extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return extension;
}

const DocumentLoader &LoaderRegistry::get_loader_for(const std::filesystem::path &file_path) const {
  const std::string extension = normalized_extension(file_path);
  auto it = loaders_by_extension_.find(extension);
  if (it == loaders_by_extension_.end()) {
    throw UnsupportedFormatError("Unsupported file type '" +
                                 (extension.empty() ? std::string("<none>") : extension) +
                                 "' for " + file_path.filename().string());
  }
  return *it->second;
}

bool LoaderRegistry::supports(const std::filesystem::path &file_path) const {
  return loaders_by_extension_.count(normalized_extension(file_path)) > 0;
}

std::vector<std::string> LoaderRegistry::supported_extensions() const {
  std::vector<std::string> extensions;
  extensions.reserve(loaders_by_extension_.size());
  for (const auto &[extension, loader] : loaders_by_extension_) {
    extensions.push_back(extension);
  }
  return extensions;
}

}  // namespace docent_core
